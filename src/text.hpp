#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "view.hpp"

enum class Alignment { Left, Center, Right };

// text may carry inline SGR tokens; they take no cells
struct TextProps {
  std::string text;
  std::optional<Style> style;
  Alignment alignment = Alignment::Left;
  bool wrap = false;
};

class Text : public View {
public:
  explicit Text(TextProps text = {}, ViewProps props = {});

  const std::string& text() const { return text_; }
  void set_text(const std::string& text);
  void set_lines(const std::vector<std::string>& lines);
  const std::optional<Style>& style() const { return style_; }
  void set_style(std::optional<Style> style) { style_ = std::move(style); }
  void set_alignment(Alignment a);
  void set_wrap(bool wrap);

  const char* type_name() const override { return "Text"; }

protected:
  Size do_natural_size(Size available) override;
  void do_render(Viewport& viewport) override;

private:
  struct Line { std::string text; int width; };
  void update_lines(const std::string& text);

  std::string text_;
  std::vector<Line> lines_;
  std::optional<Style> style_;
  Alignment alignment_;
  bool wrap_;
};
