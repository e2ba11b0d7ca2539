#pragma once

#include <ft2build.h>
#include FT_FREETYPE_H
#include <memory>
#include <stdexcept>
#include <type_traits>

struct FreeTypeLibraryDeleter {
  void operator()(FT_Library library) const { FT_Done_FreeType(library); }
};

struct FreeTypeFaceDeleter {
  void operator()(FT_Face face) const { FT_Done_Face(face); }
};

using FreeTypeLibrary =
    std::unique_ptr<std::remove_pointer_t<FT_Library>, FreeTypeLibraryDeleter>;
using FreeTypeFace =
    std::unique_ptr<std::remove_pointer_t<FT_Face>, FreeTypeFaceDeleter>;

inline FreeTypeLibrary make_freetype_library() {
  FT_Library library = nullptr;
  if (FT_Init_FreeType(&library) != 0) {
    throw std::runtime_error("Failed to initialize FreeType");
  }
  return FreeTypeLibrary(library);
}
