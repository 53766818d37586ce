/**
 * @file stream_file.cpp
 * @brief Stream a file through TorrentInput while its pieces "download"
 *
 * Places the file inside a simulated torrent (with foreign bytes before and
 * after it), finishes the pieces in random order on a background thread and
 * copies the stream to an output file as soon as the bytes become ready.
 *
 * Usage:
 *   stream_file <input_file> <output_file> [options]
 *
 * Options:
 *   --piece-length N   Piece length in bytes (default 16384)
 *   --buffer-size N    Bytes buffered each side of the position
 *   --leading N        Foreign bytes before the file in the torrent (default 1000)
 *   --delay-ms N       Delay between finished pieces (default 2)
 *   --seed N           Seed of the completion order
 *   --config PATH      JSON configuration file
 *   --verbose          Debug logging
 */

#include "torrent_input.h"
#include "torrent_layout.h"
#include "stream_config.h"
#include "stream_errors.h"
#include "fs.h"
#include "logger.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <thread>

using namespace piecestream;

static std::atomic<bool> g_interrupted{false};

static void signal_handler(int) {
    g_interrupted = true;
}

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <input_file> <output_file> [options]\n"
              << "\n"
              << "  --piece-length N   Piece length in bytes (default 16384)\n"
              << "  --buffer-size N    Bytes buffered each side of the position\n"
              << "  --leading N        Foreign bytes before the file in the torrent (default 1000)\n"
              << "  --delay-ms N       Delay between finished pieces (default 2)\n"
              << "  --seed N           Seed of the completion order\n"
              << "  --config PATH      JSON configuration file\n"
              << "  --verbose          Debug logging\n";
}

static bool parse_int(const char* text, int64_t& value) {
    char* end = nullptr;
    long long parsed = std::strtoll(text, &end, 10);
    if (!end || *end != '\0' || parsed < 0) {
        return false;
    }
    value = parsed;
    return true;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }
    
    std::string input_path = argv[1];
    std::string output_path = argv[2];
    int64_t piece_length = 16384;
    int64_t leading = 1000;
    int64_t delay_ms = 2;
    int64_t seed = std::random_device{}();
    int64_t buffer_size = -1;
    bool verbose = false;
    StreamConfig config;
    
    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        bool ok = true;
        if (arg == "--piece-length" && has_value) {
            ok = parse_int(argv[++i], piece_length) && piece_length > 0;
        } else if (arg == "--buffer-size" && has_value) {
            ok = parse_int(argv[++i], buffer_size) && buffer_size > 0;
        } else if (arg == "--leading" && has_value) {
            ok = parse_int(argv[++i], leading);
        } else if (arg == "--delay-ms" && has_value) {
            ok = parse_int(argv[++i], delay_ms);
        } else if (arg == "--seed" && has_value) {
            ok = parse_int(argv[++i], seed);
        } else if (arg == "--config" && has_value) {
            ok = load_stream_config(argv[++i], config);
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            ok = false;
        }
        if (!ok) {
            std::cerr << "Invalid argument: " << arg << "\n\n";
            print_usage(argv[0]);
            return 1;
        }
    }
    
    if (buffer_size > 0) {
        config.buffer_size = buffer_size;
    }
    if (verbose) {
        config.log_level = LogLevel::DEBUG;
    }
    apply_logging_config(config);
    
    int64_t file_size = get_file_size(input_path);
    if (file_size <= 0) {
        LOG_ERROR("main", "Input file is missing or empty: " << input_path);
        return 1;
    }
    
    // The input is the second file of the torrent, followed by a third one
    TorrentLayout layout(piece_length);
    layout.add_file("leading.bin", leading);
    layout.add_file(input_path, file_size);
    layout.add_file("trailing.bin", piece_length / 2 + 1);
    
    FileStreamParams params = layout.file_stream_params(1, config.buffer_size);
    apply_stream_config(config, params.options);
    std::shared_ptr<PieceList> pieces = params.pieces;
    
    LOG_INFO("main", "Streaming " << file_size << " bytes over pieces " << params.first_piece
             << ".." << params.last_piece << " (file starts "
             << (params.options.logical_start_offset - pieces->initial_data_offset())
             << " bytes into the first piece)");
    
    std::signal(SIGINT, signal_handler);
    CancellationSource cancel;
    
    std::thread downloader([&]() {
        std::vector<size_t> order(pieces->piece_count());
        std::iota(order.begin(), order.end(), size_t(0));
        std::mt19937_64 rng(static_cast<uint64_t>(seed));
        std::shuffle(order.begin(), order.end(), rng);
        
        for (size_t index : order) {
            if (cancel.is_cancelled()) {
                return;
            }
            pieces->set_state(index, PieceState::Downloading);
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            pieces->set_state(index, PieceState::Finished);
        }
    });
    
    std::thread watcher([&]() {
        while (!cancel.is_cancelled()) {
            if (g_interrupted) {
                LOG_WARN("main", "Interrupted");
                cancel.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
    
    int exit_code = 0;
    auto started = std::chrono::steady_clock::now();
    try {
        TorrentInput input(std::make_unique<FileRandomAccess>(input_path), pieces, params.options);
        
        FILE* out = std::fopen(output_path.c_str(), "wb");
        if (!out) {
            throw IoError("cannot open output file " + output_path);
        }
        
        std::vector<uint8_t> chunk(64 * 1024);
        int64_t total = 0;
        try {
            int64_t n;
            while ((n = input.read(chunk, cancel.token())) >= 0) {
                if (std::fwrite(chunk.data(), 1, static_cast<size_t>(n), out) != static_cast<size_t>(n)) {
                    throw IoError("write to " + output_path + " failed");
                }
                total += n;
            }
        } catch (...) {
            std::fclose(out);
            throw;
        }
        std::fclose(out);
        
        TorrentInputStats stats = input.stats();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        LOG_INFO("main", "Wrote " << total << " bytes in " << elapsed.count() << " ms; "
                 << stats.physical_reads << " physical reads, "
                 << stats.bytes_fetched << " bytes fetched, "
                 << stats.bytes_reused << " bytes reused");
    } catch (const OperationCancelled& e) {
        LOG_WARN("main", "Stopped: " << e.what());
        exit_code = 130;
    } catch (const std::exception& e) {
        LOG_ERROR("main", "Streaming failed: " << e.what());
        exit_code = 1;
    }
    
    cancel.cancel();
    downloader.join();
    watcher.join();
    return exit_code;
}
