// sg_render: load a JSON scene, draw it onto a RasterSurface and export it.
//
//   sg_render <scene.json> <out.png|out.ppm> [--font path] [--size WxH]
//             [--background css]

#include "sg/export/Snapshot.hpp"
#include "sg/io/SceneJson.hpp"
#include "sg/style/Color.hpp"
#include "sg/surface/RasterSurface.hpp"
#include "sg/text/FontFace.hpp"

#include <cstdio>
#include <string>

static void usage() {
  std::fprintf(stderr,
    "usage: sg_render <scene.json> <out.png|out.ppm> [--font path] [--size WxH]"
    " [--background css]\n");
}

static bool endsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int main(int argc, char* argv[]) {
  int W = 800, H = 600;
  std::string scenePath, outPath, fontPath;
  sg::Color background = sg::Color::transparent();
#ifdef FONT_PATH
  fontPath = FONT_PATH;
#endif

  // Parse args
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--font" && i + 1 < argc) {
      fontPath = argv[++i];
    } else if (arg == "--size" && i + 1 < argc) {
      int w = 0, h = 0;
      if (std::sscanf(argv[++i], "%dx%d", &w, &h) != 2 || w <= 0 || h <= 0) {
        std::fprintf(stderr, "bad --size '%s' (expected WxH)\n", argv[i]);
        return 2;
      }
      W = w;
      H = h;
    } else if (arg == "--background" && i + 1 < argc) {
      if (!sg::parseCssColor(argv[++i], background)) {
        std::fprintf(stderr, "bad --background '%s'\n", argv[i]);
        return 2;
      }
    } else if (scenePath.empty()) {
      scenePath = arg;
    } else if (outPath.empty()) {
      outPath = arg;
    } else {
      usage();
      return 2;
    }
  }
  if (scenePath.empty() || outPath.empty()) { usage(); return 2; }

  // 1. Load scene
  sg::LoadResult loaded = sg::loadSceneFile(scenePath);
  if (!loaded.ok) {
    std::fprintf(stderr, "%s: %s\n", scenePath.c_str(), loaded.error.c_str());
    return 1;
  }

  // 2. Fonts
  sg::FontRegistry fonts;
  if (!fontPath.empty()) {
    if (fonts.addFile("sans-serif", fontPath)) {
      std::printf("Font loaded: %s\n", fontPath.c_str());
    } else {
      std::fprintf(stderr, "cannot load font %s, text will be skipped\n", fontPath.c_str());
    }
  }

  // 3. Draw
  sg::RasterSurface surface(W, H);
  surface.setFontRegistry(&fonts);
  surface.clear(background);
  sg::RenderParams params;
  loaded.node->draw(surface, params);

  // 4. Export
  bool ok = endsWith(outPath, ".ppm") ? sg::writePPM(outPath, surface)
                                      : sg::writePNG(outPath, surface);
  if (!ok) {
    std::fprintf(stderr, "failed to write %s\n", outPath.c_str());
    return 1;
  }
  std::printf("Wrote %s (%dx%d)\n", outPath.c_str(), W, H);
  return 0;
}
