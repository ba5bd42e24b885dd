#pragma once
#include <string>

class View;

std::string describe_tree(const View& view);
