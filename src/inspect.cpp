#include "inspect.hpp"
#include "container.hpp"
#include <sstream>

static void describe_dimension(std::ostringstream& out, const char* name, const Dimension& d) {
  switch (d.mode()) {
    case Dimension::Mode::Unset: return;
    case Dimension::Mode::Fixed: out << ' ' << name << '=' << d.value(); return;
    case Dimension::Mode::Fill: out << ' ' << name << "=fill"; return;
    case Dimension::Mode::Natural: out << ' ' << name << "=natural"; return;
  }
}

static void describe(std::ostringstream& out, const View& view, int depth) {
  const ViewProps& p = view.props();
  out << std::string(depth * 2, ' ') << view.type_name() << ' ' << view.content_size().width() << 'x'
      << view.content_size().height();
  if (p.x || p.y) out << " at=" << p.x.value_or(0) << ',' << p.y.value_or(0);
  describe_dimension(out, "width", p.width);
  describe_dimension(out, "height", p.height);
  if (p.padding) {
    out << " padding=" << p.padding->top << ',' << p.padding->right << ',' << p.padding->bottom << ','
        << p.padding->left;
  }
  out << '\n';

  if (auto* c = dynamic_cast<const Container*>(&view)) {
    for (const auto& child : c->children()) describe(out, *child, depth + 1);
  }
}

std::string describe_tree(const View& view) {
  std::ostringstream out;
  describe(out, view, 0);
  return out.str();
}
