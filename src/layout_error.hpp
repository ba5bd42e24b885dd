#pragma once
#include <stdexcept>

// reentrant natural_size/render, negative sizes, foreign children
class LayoutError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};
