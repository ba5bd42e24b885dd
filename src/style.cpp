#include "style.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

Style Style::merge(const Style& local) const {
  Style out = *this;
  if (local.foreground) out.foreground = local.foreground;
  if (local.background) out.background = local.background;
  if (local.bold) out.bold = local.bold;
  if (local.dim) out.dim = local.dim;
  if (local.italic) out.italic = local.italic;
  if (local.underline) out.underline = local.underline;
  if (local.inverse) out.inverse = local.inverse;
  if (local.strikeout) out.strikeout = local.strikeout;
  return out;
}

bool Style::is_sgr(std::string_view token) {
  return token.size() >= 3 && token[0] == '\x1b' && token[1] == '[' && token.back() == 'm';
}

// parameters saturate here; real codes never get close
static constexpr int kMaxSgrParam = 65535;

static std::vector<int> sgr_params(std::string_view token) {
  std::vector<int> params;
  std::string_view body = token.substr(2, token.size() - 3);
  if (body.empty()) { params.push_back(0); return params; }
  int cur = 0;
  bool have = false;
  for (char c : body) {
    if (std::isdigit(static_cast<unsigned char>(c))) { cur = std::min(cur * 10 + (c - '0'), kMaxSgrParam); have = true; }
    else if (c == ';') { params.push_back(have ? cur : 0); cur = 0; have = false; }
  }
  params.push_back(have ? cur : 0);
  return params;
}

Style Style::from_sgr(std::string_view token, const Style& current, const Style& reset) {
  if (!is_sgr(token)) return current;
  Style s = current;
  std::vector<int> p = sgr_params(token);
  for (size_t i = 0; i < p.size(); ++i) {
    int code = p[i];
    switch (code) {
      case 0: s = reset; break;
      case 1: s.bold = true; break;
      case 2: s.dim = true; break;
      case 3: s.italic = true; break;
      case 4: s.underline = true; break;
      case 7: s.inverse = true; break;
      case 9: s.strikeout = true; break;
      case 22: s.bold = false; s.dim = false; break;
      case 23: s.italic = false; break;
      case 24: s.underline = false; break;
      case 27: s.inverse = false; break;
      case 29: s.strikeout = false; break;
      case 39: s.foreground = reset.foreground; break;
      case 49: s.background = reset.background; break;
      case 38:
      case 48:
        // 38;5;n / 48;5;n
        if (i + 2 < p.size() && p[i + 1] == 5) {
          // indices outside the 256-colour palette are skipped
          if (p[i + 2] <= 255) {
            if (code == 38) s.foreground = p[i + 2]; else s.background = p[i + 2];
          }
          i += 2;
        }
        break;
      default:
        if (code >= 30 && code <= 37) s.foreground = code - 30;
        else if (code >= 40 && code <= 47) s.background = code - 40;
        else if (code >= 90 && code <= 97) s.foreground = code - 90 + 8;
        else if (code >= 100 && code <= 107) s.background = code - 100 + 8;
        break;
    }
  }
  return s;
}

static void append_color(std::string& out, int color, bool fg) {
  if (color < 0) { out += fg ? ";39" : ";49"; return; }
  if (color < 8) out += ";" + std::to_string((fg ? 30 : 40) + color);
  else if (color < 16) out += ";" + std::to_string((fg ? 90 : 100) + color - 8);
  else out += std::string(fg ? ";38;5;" : ";48;5;") + std::to_string(color);
}

std::string Style::to_sgr() const {
  std::string out = "\x1b[0";
  if (is_bold()) out += ";1";
  if (is_dim()) out += ";2";
  if (is_italic()) out += ";3";
  if (is_underline()) out += ";4";
  if (is_inverse()) out += ";7";
  if (is_strikeout()) out += ";9";
  if (foreground) append_color(out, *foreground, true);
  if (background) append_color(out, *background, false);
  out += "m";
  return out;
}
