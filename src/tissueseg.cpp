#include "tissueseg.h"

static void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [options]\n\n"
              << "Commands:\n"
              << "  segment-tissue  Threshold, clean, filter and polygonize the tissue, then compare with spot flags\n"
              << "  label-regions   Label connected regions of the cleaned mask to calibrate exclusion lists\n\n"
              << "Run '" << prog << " <command> --help' for the options of a command\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }
    std::string cmd(argv[1]);
    if (cmd == "-h" || cmd == "--help" || cmd == "help") {
        printUsage(argv[0]);
        return 0;
    }
    try {
        if (cmd == "segment-tissue") {
            return cmdSegmentTissue(argc - 1, argv + 1);
        } else if (cmd == "label-regions") {
            return cmdLabelRegions(argc - 1, argv + 1);
        }
    } catch (const std::exception& ex) {
        // error() has already logged the message
        std::cerr << "Aborted: " << ex.what() << "\n";
        return 1;
    }
    std::cerr << "Unknown command: " << cmd << "\n";
    printUsage(argv[0]);
    return 1;
}
