// sigil-import: Convert a SQLite campaign database into a JSON snapshot
//
// Usage: sigil_import [OPTIONS]
//
// Options:
//   --db PATH         SQLite database to read (opened read-only)
//   --output PATH     Snapshot file to write (default: stdout)
//   --check           Load the result as a record source and report skips
//   --verbose         Show detailed progress

#include <sigil/record_source.hpp>
#include <sigil/version.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <fstream>

using namespace sigil;
using json = nlohmann::json;

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --db PATH         SQLite database to read\n"
              << "  --output PATH     Snapshot file to write (default: stdout)\n"
              << "  --check           Validate records after conversion\n"
              << "  --verbose, -v     Show detailed progress\n"
              << "  --help, -h        Show this help\n";
}

int main(int argc, char* argv[]) {
    std::string db_path;
    std::string output_path;
    bool check = false;
    bool verbose = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else if (strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            output_path = argv[++i];
        } else if (strcmp(argv[i], "--check") == 0) {
            check = true;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (db_path.empty()) {
        std::cerr << "Error: --db is required\n";
        print_usage(argv[0]);
        return 1;
    }

    log::set_level(verbose ? log::Level::Debug : log::Level::Warn);

    json snapshot;
    try {
        snapshot = SqliteRecordSource::read_database(db_path);
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Read " << snapshot["conditions"].size() << " conditions, "
              << snapshot["effects"].size() << " effects, "
              << snapshot["entities"].size() << " entities from " << db_path << "\n";

    if (check) {
        JsonRecordSource source(snapshot);
        for (const auto& w : source.warnings()) {
            std::cerr << "  skipped: " << w << "\n";
        }
        std::cerr << "Check: " << source.warnings().size() << " record(s) would be skipped\n";
    }

    std::string text = snapshot.dump(2, ' ', false, json::error_handler_t::replace);
    if (output_path.empty()) {
        std::cout << text << "\n";
        return 0;
    }

    std::ofstream out(output_path);
    if (!out) {
        std::cerr << "Error: cannot write " << output_path << "\n";
        return 1;
    }
    out << text << "\n";
    out.close();
    if (!out) {
        std::cerr << "Error: write to " << output_path << " failed\n";
        return 1;
    }
    std::cerr << "Wrote snapshot (format " << SIGIL_SNAPSHOT_FORMAT << ") to " << output_path << "\n";
    return 0;
}
