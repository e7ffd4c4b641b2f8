#pragma once
#include <ostream>
#include <string>
#include <vector>

// args excludes the program name
int cmd_search(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

int cmd_search(int argc, char** argv);
