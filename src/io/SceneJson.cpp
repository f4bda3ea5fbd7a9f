#include "sg/io/SceneJson.hpp"
#include "sg/scene/AreaText.hpp"
#include "sg/scene/Group.hpp"
#include "sg/scene/Path.hpp"
#include "sg/scene/TextItem.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace sg {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

void writeColor(JsonWriter& w, const char* key, const std::optional<Color>& c) {
  w.Key(key);
  if (c) {
    std::string css = c->toCss();
    w.String(css.c_str());
  } else {
    w.Null();
  }
}

void writePoint(JsonWriter& w, const Point& p) {
  w.StartArray();
  w.Double(p.x);
  w.Double(p.y);
  w.EndArray();
}

void writeStyle(JsonWriter& w, const CharacterStyle& s) {
  writeColor(w, "fillColor", s.fillColor);
  writeColor(w, "strokeColor", s.strokeColor);
  w.Key("strokeWidth"); w.Double(static_cast<double>(s.strokeWidth));
  w.Key("fontFamily");  w.String(s.fontFamily.c_str());
  w.Key("fontWeight");  w.String(s.fontWeight.c_str());
  w.Key("fontSize");    w.Double(static_cast<double>(s.fontSize));
  if (s.leading) {
    w.Key("leading"); w.Double(static_cast<double>(*s.leading));
  }
  w.Key("justification"); w.String(toString(s.justification));
}

void writeNode(JsonWriter& w, const Node& node, const SerializeOptions& opts) {
  w.StartObject();
  w.Key("type"); w.String(toString(node.kind()));
  if (!node.name().empty()) {
    w.Key("name"); w.String(node.name().c_str());
  }
  if (!node.matrix().isIdentity()) {
    const Matrix& m = node.matrix();
    w.Key("matrix");
    w.StartArray();
    w.Double(m.a); w.Double(m.b); w.Double(m.c);
    w.Double(m.d); w.Double(m.tx); w.Double(m.ty);
    w.EndArray();
  }
  w.Key("clipMask");  w.Bool(node.isClipMask());
  w.Key("clippable"); w.Bool(node.isClippable());
  w.Key("visible");   w.Bool(node.isVisible());

  switch (node.kind()) {
    case NodeKind::Group: {
      const auto& g = static_cast<const Group&>(node);
      w.Key("compositing");      w.String(toString(g.compositing()));
      w.Key("transformContent"); w.Bool(g.transformContent());
      if (!opts.excludeChildren) {
        w.Key("children");
        w.StartArray();
        for (const auto& c : g.children()) writeNode(w, *c, opts);
        w.EndArray();
      }
      break;
    }
    case NodeKind::Path:
    case NodeKind::AreaText: {
      const auto& p = static_cast<const Path&>(node);
      w.Key("closed"); w.Bool(p.isClosed());
      w.Key("points");
      w.StartArray();
      for (const auto& pt : p.points()) writePoint(w, pt);
      w.EndArray();
      writeStyle(w, p.style());
      if (node.kind() == NodeKind::AreaText) {
        const auto& at = static_cast<const AreaText&>(node);
        if (at.text()) {
          w.Key("text");
          writeNode(w, *at.text(), opts);
        }
      }
      break;
    }
    case NodeKind::TextItem: {
      const auto& t = static_cast<const TextItem&>(node);
      w.Key("content"); w.String(t.content().c_str());
      w.Key("point");   writePoint(w, t.point());
      writeStyle(w, t.style());
      break;
    }
  }
  w.EndObject();
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

struct Reader {
  std::string error;

  bool fail(const std::string& msg) {
    if (error.empty()) error = msg;
    return false;
  }

  bool readColor(const rapidjson::Value& obj, const char* key, std::optional<Color>& out) {
    if (!obj.HasMember(key)) return true;
    const auto& v = obj[key];
    if (v.IsNull()) { out.reset(); return true; }
    if (!v.IsString()) return fail(std::string(key) + " must be a CSS color string or null");
    Color c;
    if (!parseCssColor(v.GetString(), c)) return fail(std::string("bad color: ") + v.GetString());
    out = c;
    return true;
  }

  bool readPoint(const rapidjson::Value& v, Point& out) {
    if (!v.IsArray() || v.Size() != 2 || !v[0u].IsNumber() || !v[1u].IsNumber())
      return fail("point must be [x, y]");
    out = {v[0u].GetDouble(), v[1u].GetDouble()};
    return true;
  }

  bool readStyle(const rapidjson::Value& v, CharacterStyle& s) {
    if (!readColor(v, "fillColor", s.fillColor)) return false;
    if (!readColor(v, "strokeColor", s.strokeColor)) return false;
    if (v.HasMember("strokeWidth") && v["strokeWidth"].IsNumber())
      s.strokeWidth = static_cast<float>(v["strokeWidth"].GetDouble());
    if (v.HasMember("fontFamily") && v["fontFamily"].IsString() && v["fontFamily"].GetStringLength() > 0)
      s.fontFamily = v["fontFamily"].GetString();
    if (v.HasMember("fontWeight") && v["fontWeight"].IsString() && v["fontWeight"].GetStringLength() > 0)
      s.fontWeight = v["fontWeight"].GetString();
    if (v.HasMember("fontSize") && v["fontSize"].IsNumber())
      s.fontSize = static_cast<float>(v["fontSize"].GetDouble());
    if (v.HasMember("leading") && v["leading"].IsNumber() && v["leading"].GetDouble() != 0.0)
      s.leading = static_cast<float>(v["leading"].GetDouble());
    if (v.HasMember("justification") && v["justification"].IsString()) {
      if (!parseJustification(v["justification"].GetString(), s.justification))
        return fail(std::string("bad justification: ") + v["justification"].GetString());
    }
    return true;
  }

  bool readPoints(const rapidjson::Value& v, std::vector<Point>& out) {
    if (!v.HasMember("points")) return true;
    if (!v["points"].IsArray()) return fail("points must be an array");
    for (const auto& p : v["points"].GetArray()) {
      Point pt;
      if (!readPoint(p, pt)) return false;
      out.push_back(pt);
    }
    return true;
  }

  // Fields shared by every node; applied before the node is attached.
  bool readBase(const rapidjson::Value& v, Node& node) {
    if (v.HasMember("name") && v["name"].IsString()) node.setName(v["name"].GetString());
    if (v.HasMember("clipMask") && v["clipMask"].IsBool()) node.setClipMask(v["clipMask"].GetBool());
    if (v.HasMember("clippable") && v["clippable"].IsBool()) node.setClippable(v["clippable"].GetBool());
    if (v.HasMember("visible") && v["visible"].IsBool()) node.setVisible(v["visible"].GetBool());
    return true;
  }

  bool readMatrix(const rapidjson::Value& v, Node& node) {
    if (!v.HasMember("matrix")) return true;
    const auto& m = v["matrix"];
    if (!m.IsArray() || m.Size() != 6) return fail("matrix must have 6 numbers");
    double e[6];
    for (unsigned i = 0; i < 6; i++) {
      if (!m[i].IsNumber()) return fail("matrix must have 6 numbers");
      e[i] = m[i].GetDouble();
    }
    node.setMatrix({e[0], e[1], e[2], e[3], e[4], e[5]});
    return true;
  }

  std::unique_ptr<TextItem> readTextItem(const rapidjson::Value& v) {
    auto t = std::make_unique<TextItem>();
    if (v.HasMember("content") && v["content"].IsString()) t->setContent(v["content"].GetString());
    if (v.HasMember("point")) {
      Point p;
      if (!readPoint(v["point"], p)) return nullptr;
      t->setPoint(p);
    }
    CharacterStyle s = t->style();
    if (!readStyle(v, s)) return nullptr;
    t->setStyle(s);
    return t;
  }

  std::unique_ptr<Node> readNode(const rapidjson::Value& v) {
    if (!v.IsObject()) { fail("node must be an object"); return nullptr; }
    if (!v.HasMember("type") || !v["type"].IsString()) { fail("node is missing \"type\""); return nullptr; }
    const std::string type = v["type"].GetString();

    std::unique_ptr<Node> node;
    if (type == "Group") {
      auto g = std::make_unique<Group>();
      if (v.HasMember("compositing") && v["compositing"].IsString()) {
        CompositeOp op;
        if (!parseCompositeOp(v["compositing"].GetString(), op)) {
          fail(std::string("bad compositing: ") + v["compositing"].GetString());
          return nullptr;
        }
        g->setCompositing(op);
      }
      if (v.HasMember("transformContent") && v["transformContent"].IsBool())
        g->setTransformContent(v["transformContent"].GetBool());
      if (v.HasMember("children")) {
        if (!v["children"].IsArray()) { fail("children must be an array"); return nullptr; }
        for (const auto& c : v["children"].GetArray()) {
          std::unique_ptr<Node> child = readNode(c);
          if (!child) return nullptr;
          g->addChild(std::move(child));
        }
      }
      node = std::move(g);
    } else if (type == "Path") {
      auto p = std::make_unique<Path>();
      std::vector<Point> pts;
      if (!readPoints(v, pts)) return nullptr;
      p->setPoints(std::move(pts));
      if (v.HasMember("closed") && v["closed"].IsBool()) p->setClosed(v["closed"].GetBool());
      CharacterStyle s = p->style();
      if (!readStyle(v, s)) return nullptr;
      p->setFillColor(s.fillColor);
      p->setStrokeColor(s.strokeColor);
      p->setStrokeWidth(s.strokeWidth);
      node = std::move(p);
    } else if (type == "AreaText") {
      std::vector<Point> pts;
      if (!readPoints(v, pts)) return nullptr;
      auto at = std::make_unique<AreaText>(std::move(pts));
      CharacterStyle s = at->style();
      if (!readStyle(v, s)) return nullptr;
      at->setStrokeWidth(s.strokeWidth);
      at->setJustification(s.justification);
      at->setColorStyle(s.fillColor, s.strokeColor);
      at->setFontStyle(s.fontSize, s.leading, s.fontFamily);
      if (v.HasMember("text")) {
        std::unique_ptr<TextItem> t = readTextItem(v["text"]);
        if (!t) return nullptr;
        at->setText(std::move(t));
      }
      node = std::move(at);
    } else if (type == "TextItem") {
      node = readTextItem(v);
      if (!node) return nullptr;
    } else {
      fail("unknown node type: " + type);
      return nullptr;
    }

    if (!readBase(v, *node)) return nullptr;
    if (!readMatrix(v, *node)) return nullptr;
    return node;
  }
};

} // namespace

std::string toJSON(const Node& node, const SerializeOptions& options) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  writeNode(w, node, options);
  return sb.GetString();
}

LoadResult fromJSON(const std::string& json) {
  LoadResult r;
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    r.ok = false;
    r.error = "JSON parse error at offset " + std::to_string(doc.GetErrorOffset());
    return r;
  }

  Reader reader;
  r.node = reader.readNode(doc);
  if (!r.node) {
    r.ok = false;
    r.error = reader.error.empty() ? "invalid scene" : reader.error;
  }
  return r;
}

bool saveSceneFile(const std::string& path, const Node& node, const SerializeOptions& options) {
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    std::fprintf(stderr, "SceneJson: cannot write %s\n", path.c_str());
    return false;
  }
  f << toJSON(node, options);
  return static_cast<bool>(f);
}

LoadResult loadSceneFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    LoadResult r;
    r.ok = false;
    r.error = "cannot open " + path;
    return r;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  return fromJSON(ss.str());
}

} // namespace sg
