#include "text.hpp"
#include "unicode.hpp"
#include "viewport.hpp"
#include <algorithm>
#include <cctype>

Text::Text(TextProps text, ViewProps props)
  : View(std::move(props)), style_(std::move(text.style)), alignment_(text.alignment), wrap_(text.wrap) {
  update_lines(text.text);
}

void Text::set_text(const std::string& text) {
  if (text == text_) return;
  update_lines(text);
}

void Text::set_lines(const std::vector<std::string>& lines) {
  std::string joined;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i) joined += '\n';
    joined += lines[i];
  }
  set_text(joined);
}

void Text::set_alignment(Alignment a) {
  alignment_ = a;
}

void Text::set_wrap(bool wrap) {
  if (wrap_ == wrap) return;
  wrap_ = wrap;
  invalidate_size();
}

void Text::update_lines(const std::string& text) {
  text_ = text;
  lines_.clear();
  if (!text.empty()) {
    for (auto& l : split_lines(text)) {
      int w = line_width(l);
      lines_.push_back(Line{std::move(l), w});
    }
  }
  invalidate_size();
}

Size Text::do_natural_size(Size available) {
  MutableSize size;
  for (const auto& line : lines_) {
    if (wrap_) {
      int avail = available.width();
      size.width = avail;
      size.height += (avail > 0 && line.width > avail) ? (line.width + avail - 1) / avail : 1;
    } else {
      size.width = std::max(size.width, line.width);
      size.height += 1;
    }
  }
  return size.freeze();
}

void Text::do_render(Viewport& viewport) {
  if (viewport.is_empty()) return;

  Style style = theme().text();
  if (style_) style = style.merge(*style_);
  const int width = viewport.content_size().width();

  viewport.using_pen(style, [&](Pen& pen) {
    MutablePoint pt;
    for (const auto& line : lines_) {
      if (line.text.empty()) { pt.y += 1; continue; }

      bool did_wrap = false;
      pt.x = alignment_ == Alignment::Left ? 0
           : alignment_ == Alignment::Center ? (width - line.width) / 2
           : width - line.width;
      for (const auto& ch : printable_chars(line.text)) {
        int w = char_width(ch);
        if (w == 0) {
          // keep tracking the pen even past the right edge
          if (Style::is_sgr(ch)) pen.apply_sgr(ch);
          continue;
        }
        if (wrap_ && pt.x >= width) {
          did_wrap = true;
          pt.x = 0;
          pt.y += 1;
        }
        if (did_wrap && ch.size() == 1 && std::isspace(static_cast<unsigned char>(ch[0]))) continue;
        did_wrap = false;

        viewport.write(ch, pt.freeze());
        pt.x += w;
      }
      pt.y += 1;
    }
  });
}
