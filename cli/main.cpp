#include "cli.h"

int main(int argc, char* argv[]) {
    return docpress::cli::main(argc, argv);
}
