#include <algorithm>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <tfrecord/Dataset.hpp>
#include <tfrecord/Errors.hpp>

// ---------------------------------------------------------------------------
// tfrecord_info
// ---------------------------------------------------------------------------
// Indexes one or more record containers and prints how many records each
// holds and how large they are. Useful to sanity check training shards
// before pointing a pipeline at them.
// ---------------------------------------------------------------------------

namespace {

void usage() {
    std::cerr << "Usage:\n"
              << "  tfrecord_info [options] <path>...\n"
              << "Options:\n"
              << "  --no-check           skip checksum verification\n"
              << "  --max-open-files N   cap simultaneously open files\n"
              << "  --max-workers N      cap concurrent indexing workers\n"
              << "  --verbose            report each file as it is indexed\n";
}

size_t parse_positive(const std::string& flag, const std::string& value) {
    size_t consumed = 0;
    unsigned long long n = std::stoull(value, &consumed);
    if (consumed != value.size() || n == 0)
        throw std::invalid_argument(flag + " expects a positive integer, got '" + value + "'");
    return static_cast<size_t>(n);
}

struct FileSummary {
    size_t records{0};
    uint64_t bytes{0};
};

} // namespace

int main(int argc, char** argv) {
    tfrecord::DatasetInit init;
    std::vector<std::string> paths;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--no-check") {
                init.checkIntegrity = false;
            } else if (arg == "--verbose") {
                verbose = true;
            } else if ((arg == "--max-open-files" || arg == "--max-workers") && i + 1 < argc) {
                size_t n = parse_positive(arg, argv[++i]);
                if (arg == "--max-open-files")
                    init.maxOpenFiles = n;
                else
                    init.maxWorkers = n;
            } else if (arg == "--help" || arg == "-h") {
                usage();
                return 0;
            } else if (arg.rfind("--", 0) == 0) {
                std::cerr << "unknown option: " << arg << "\n";
                usage();
                return 1;
            } else {
                paths.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        usage();
        return 1;
    }

    if (paths.empty()) {
        usage();
        return 1;
    }

    std::mutex log_mutex;
    if (verbose) {
        init.onFileIndexed = [&](const std::string& path, size_t records) {
            std::lock_guard<std::mutex> lock(log_mutex);
            std::cerr << "indexed " << path << ": " << records << " records\n";
        };
    }

    try {
        tfrecord::Dataset dataset = init.fromPaths(paths);

        std::map<std::string, FileSummary> per_file;
        uint64_t total_bytes = 0;
        uint64_t min_len = UINT64_MAX;
        uint64_t max_len = 0;
        for (const auto& loc : dataset.index()) {
            auto& summary = per_file[*loc.path];
            ++summary.records;
            summary.bytes += loc.length;
            total_bytes += loc.length;
            min_len = std::min(min_len, loc.length);
            max_len = std::max(max_len, loc.length);
        }

        for (const auto& path : paths) {
            const FileSummary& s = per_file[path];
            std::cout << path << "\t" << s.records << " records\t" << s.bytes << " bytes\n";
        }

        std::cout << "total\t" << dataset.numRecords() << " records\t" << total_bytes << " bytes\n";
        if (dataset.numRecords() > 0) {
            std::cout << "payload size\tmin " << min_len << "\tmax " << max_len << "\n";
        }
    } catch (const tfrecord::TFRecordError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "unexpected error: " << e.what() << "\n";
        return 2;
    }

    return 0;
}
