#include "commands/search.hpp"

int main(int argc, char** argv) {
    return cmd_search(argc, argv);
}
