#include "chanarc/archive_reader.h"
#include <iostream>
#include <string>
#include <vector>

using namespace chanarc;

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " ARCHIVE" << std::endl;
        return 2;
    }

    ArchiveReader reader;
    std::vector<Record> records;
    ReaderStats stats;

    ReadResult result = reader.readAll(argv[1], records, stats);
    if (result != ReadResult::SUCCESS) {
        std::cerr << "[chanarc_dump] Error: " << reader.getLastError() << std::endl;
        return 1;
    }

    for (const Record& record : records) {
        std::cout << "<" << record.username << "> " << record.content << "\n";
    }
    std::cout.flush();

    std::cerr << "[chanarc_dump] " << stats.records_read << " records in "
              << stats.frames_read << " frames, " << stats.uncompressed_bytes
              << " bytes uncompressed";
    if (stats.corrupt_regions > 0) {
        std::cerr << ", skipped " << stats.skipped_bytes << " bytes in "
                  << stats.corrupt_regions << " unreadable regions";
    }
    std::cerr << std::endl;

    return 0;
}
