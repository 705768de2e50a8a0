// camring_inspect.cpp
// List the frames stored in an XRAW bulk archive written by Exporter::save_bulk.
//
// Usage:  ./camring_inspect archive.xraw

#include "camring/Errors.hpp"
#include "camring/Exporter.hpp"

#include <iomanip>
#include <iostream>

using namespace std;

int main(int argc, char** argv)
{
    if (argc < 2) {
        cerr << "usage: " << argv[0] << " archive.xraw\n";
        return 1;
    }

    camring::Archive archive;
    try {
        archive = camring::load_archive(argv[1]);
    } catch (const std::exception& e) {
        cerr << "camring_inspect: " << e.what() << "\n";
        return 1;
    }

    cout << argv[1] << ": " << archive.entries.size() << " frames, "
         << (archive.compressed ? "LZ4" : "uncompressed")
         << ", created " << archive.created_unix_ns << " ns\n";

    size_t raw_total = 0, disk_total = 0;
    for (const auto& e : archive.entries) {
        const size_t raw = e.frame.total() * e.frame.elemSize();
        raw_total += raw;
        disk_total += e.payload_bytes;
        cout << "  slot " << setw(4) << setfill('0') << e.slot_index << setfill(' ')
             << "  " << e.frame.cols << "x" << e.frame.rows
             << " ch=" << e.frame.channels()
             << " depth=" << e.frame.depth()
             << " bytes=" << raw << " stored=" << e.payload_bytes << "\n";
    }

    if (disk_total > 0) {
        cout << "total " << raw_total << " bytes, stored " << disk_total << " bytes, ratio="
             << fixed << setprecision(2) << (double)raw_total / disk_total << "x\n";
    }
    return 0;
}
