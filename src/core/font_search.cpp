#include "font_search.hpp"
#include FT_TRUETYPE_TABLES_H
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <string>
#include <system_error>
#include <unordered_set>

static bool is_font_file(const fs::path &path) {
  static const std::unordered_set<std::string> extensions = {".ttf", ".otf",
                                                             ".ttc", ".otc"};
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return extensions.contains(ext);
}

static double width_class_to_percent(FT_UShort width_class) {
  static constexpr std::array<double, 9> percents = {
      50.0, 62.5, 75.0, 87.5, 100.0, 112.5, 125.0, 150.0, 200.0};
  if (width_class < 1 || width_class > percents.size()) {
    return 100.0;
  }
  return percents[width_class - 1];
}

static FontInfo describe_face(FT_Face face) {
  FontInfo info;
  info.family = face->family_name ? face->family_name : "";

  std::string style_name = face->style_name ? face->style_name : "";
  if (style_name.find("Oblique") != std::string::npos) {
    info.variant.style = FontStyle::Oblique;
  } else if (face->style_flags & FT_STYLE_FLAG_ITALIC) {
    info.variant.style = FontStyle::Italic;
  }

  auto *os2 = static_cast<TT_OS2 *>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
  if (os2 && os2->version != 0xFFFF) {
    info.variant.weight = std::clamp<std::uint16_t>(os2->usWeightClass, 100, 900);
    info.variant.stretch = width_class_to_percent(os2->usWidthClass);
  } else if (face->style_flags & FT_STYLE_FLAG_BOLD) {
    info.variant.weight = 700;
  }

  return info;
}

FontSearcher::FontSearcher() : library_(make_freetype_library()) {}

void FontSearcher::search_system() {
#if defined(__APPLE__)
  search_dir("/Library/Fonts");
  search_dir("/Network/Library/Fonts");
  search_dir("/System/Library/Fonts");
  if (const char *home = std::getenv("HOME")) {
    search_dir(fs::path(home) / "Library" / "Fonts");
  }
#else
  search_dir("/usr/share/fonts");
  search_dir("/usr/local/share/fonts");

  if (const char *data_home = std::getenv("XDG_DATA_HOME");
      data_home && *data_home) {
    search_dir(fs::path(data_home) / "fonts");
  } else if (const char *home = std::getenv("HOME")) {
    search_dir(fs::path(home) / ".local" / "share" / "fonts");
  }
#endif
}

void FontSearcher::search_dir(const fs::path &dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return;
  }

  std::vector<fs::path> files;
  auto options = fs::directory_options::follow_directory_symlink |
                 fs::directory_options::skip_permission_denied;
  for (auto it = fs::recursive_directory_iterator(dir, options, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (it->is_regular_file(ec) && is_font_file(it->path())) {
      files.push_back(it->path());
    }
  }

  std::sort(files.begin(), files.end());
  for (const auto &file : files) {
    search_file(file);
  }
}

void FontSearcher::search_file(const fs::path &path) {
  FT_Face probe = nullptr;
  if (FT_New_Face(library_.get(), path.c_str(), -1, &probe) != 0) {
    return;
  }
  FT_Long num_faces = probe->num_faces;
  FT_Done_Face(probe);

  for (FT_Long i = 0; i < num_faces; ++i) {
    FT_Face raw = nullptr;
    if (FT_New_Face(library_.get(), path.c_str(), i, &raw) != 0) {
      continue;
    }
    FreeTypeFace face(raw);

    book_.push(describe_face(face.get()));
    locations_.push_back({path, static_cast<std::uint32_t>(i)});
  }
}
