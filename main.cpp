#include <iostream>
#include <string>
#include <vector>
#include <getopt.h> // getopt_long()
#include "commands.hpp"
#include "errors.hpp"
#include "utils.hpp"

using namespace std;

#define PNGMSG_VERSION "0.1.0"


static void usage(const char* progname) {
    cerr << "Tool for creating and reading hidden messages inside PNG files\n"
         << "Usage:\n"
         << "  " << progname << " [-v] hide -i <input> -c <type> -m <message> [-o <output>]\n"
         << "  " << progname << " [-v] find -p <path> -c <type>\n"
         << "  " << progname << " [-v] delete -p <path> -c <type>\n"
         << "\n"
         << "  hide    hides a message inside a png file and writes it to the desired destination\n"
         << "  find    decodes and prints the message(s) inside the given png file\n"
         << "  delete  removes the message(s) from the given png file\n"
         << "\n"
         << "Options:\n"
         << "  -i, --input-path   path to the source image\n"
         << "  -p, --path         path to the image\n"
         << "  -c, --chunk-type   four letter PNG chunk type, e.g. ruSt\n"
         << "  -m, --message      message to hide\n"
         << "  -o, --output-path  where to write the result (default: overwrite input)\n"
         << "  -v, --verbose      more diagnostics on stderr, repeat for more\n"
         << "  -V, --version      print version\n"
         << "  -h, --help         this help\n";
}


static bool require(const string& value, const char* option, const string& command) {
    if (value.empty()) {
        cerr << "ERROR: " << command << " needs " << option << endl;
        return false;
    }
    return true;
}


int main(int argc, char** argv) {
    string inputPath;
    string path;
    string chunkType;
    string message;
    string outputPath;
    bool haveMessage = false;

    int c;
    int longOptionIndex;
    struct option longOptions[] = {
        {"help",        no_argument,       NULL, 'h'},
        {"verbose",     no_argument,       NULL, 'v'},
        {"version",     no_argument,       NULL, 'V'},
        {"input-path",  required_argument, NULL, 'i'},
        {"path",        required_argument, NULL, 'p'},
        {"chunk-type",  required_argument, NULL, 'c'},
        {"message",     required_argument, NULL, 'm'},
        {"output-path", required_argument, NULL, 'o'},
        {NULL, 0, NULL, 0}
    };
    while ((c = getopt_long(argc, argv, "c:hi:m:o:p:vV", longOptions, &longOptionIndex)) != -1) {
        switch (c) {
            case 'c': chunkType = optarg; break;
            case 'i': inputPath = optarg; break;
            case 'm': message = optarg; haveMessage = true; break;
            case 'o': outputPath = optarg; break;
            case 'p': path = optarg; break;
            case 'v': Verbose++; break;
            case 'V': cout << PNGMSG_VERSION << endl; return 0;
            case 'h': usage(argv[0]); return 0;
            default: usage(argv[0]); return 1;
        }
    }

    if (optind + 1 != argc) {
        usage(argv[0]);
        return 1;
    }
    string command = argv[optind];

    try {
        if (command == "hide") {
            if (!require(inputPath, "-i", command) || !require(chunkType, "-c", command))
                return 1;
            if (!haveMessage) { // an empty message is allowed
                cerr << "ERROR: hide needs -m" << endl;
                return 1;
            }
            hideMessage(inputPath, chunkType, message, outputPath);
        } else if (command == "find") {
            if (!require(path, "-p", command) || !require(chunkType, "-c", command))
                return 1;
            vector<string> messages = findMessages(path, chunkType);
            string joined;
            for (size_t i = 0; i < messages.size(); ++i) {
                if (i > 0)
                    joined += '\n';
                joined += messages[i];
            }
            slowPrint(cout, joined);
            cout << endl;
        } else if (command == "delete") {
            if (!require(path, "-p", command) || !require(chunkType, "-c", command))
                return 1;
            deleteMessages(path, chunkType);
        } else {
            cerr << "ERROR: unknown command '" << command << "'" << endl;
            usage(argv[0]);
            return 1;
        }
    } catch (const PngError& e) {
        cerr << "ERROR: " << e.what() << endl;
        return 1;
    } catch (const exception& e) {
        cerr << "ERROR: " << e.what() << endl;
        return 1;
    }

    return 0;
}
