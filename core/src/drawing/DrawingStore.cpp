#include "sc/drawing/DrawingStore.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace sc {

namespace {

struct TypeInfo {
  DrawingType type;
  const char* name;
  std::size_t points;
};

const TypeInfo kTypes[] = {
  {DrawingType::Trendline,       "trendline",  2},
  {DrawingType::Segment,         "segment",    2},
  {DrawingType::Ray,             "ray",        2},
  {DrawingType::Horizontal,      "horizontal", 1},
  {DrawingType::Vertical,        "vertical",   1},
  {DrawingType::ParallelChannel, "parallel",   3},
  {DrawingType::Fibonacci,       "fibonacci",  2},
  {DrawingType::GoldenRatio,     "golden",     2},
  {DrawingType::Rectangle,       "rectangle",  2},
  {DrawingType::Text,            "text",       1},
};

const TypeInfo* infoFor(DrawingType type) {
  for (const auto& t : kTypes) {
    if (t.type == type) return &t;
  }
  return nullptr;
}

bool isBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(),
    [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

std::size_t pointCountFor(DrawingType type) {
  const TypeInfo* t = infoFor(type);
  return t ? t->points : 0;
}

const char* drawingTypeName(DrawingType type) {
  const TypeInfo* t = infoFor(type);
  return t ? t->name : "unknown";
}

bool parseDrawingType(const std::string& name, DrawingType& out) {
  for (const auto& t : kTypes) {
    if (name == t.name) {
      out = t.type;
      return true;
    }
  }
  return false;
}

std::size_t textLength(const std::string& text) {
  std::size_t n = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) ++n;  // skip continuation bytes
  }
  return n;
}

bool DrawingStore::validate(DrawingType type, const std::vector<ChartPoint>& points,
                            const std::string& text) {
  std::size_t expected = pointCountFor(type);
  if (expected == 0 || points.size() != expected) return false;
  for (const auto& p : points) {
    if (!std::isfinite(p.logicalIndex) || !std::isfinite(p.price)) return false;
  }
  if (type == DrawingType::Text && isBlank(text)) return false;
  return true;
}

std::uint32_t DrawingStore::add(DrawingType type, std::vector<ChartPoint> points,
                                const float color[4], std::string text) {
  if (!validate(type, points, text)) return 0;
  if (nextId_ == UINT32_MAX) {
    std::fprintf(stderr, "DrawingStore: drawing ids exhausted\n");
    return 0;
  }

  Drawing d;
  d.id = nextId_++;
  d.type = type;
  d.points = std::move(points);
  if (color) std::copy(color, color + 4, d.color);
  if (type == DrawingType::Text) d.text = std::move(text);
  drawings_.push_back(std::move(d));
  return drawings_.back().id;
}

bool DrawingStore::remove(std::uint32_t id) {
  auto it = std::remove_if(drawings_.begin(), drawings_.end(),
    [id](const Drawing& d) { return d.id == id; });
  bool removed = it != drawings_.end();
  drawings_.erase(it, drawings_.end());
  return removed;
}

void DrawingStore::clear() {
  // nextId_ keeps counting so ids are never reused within a session.
  drawings_.clear();
}

const Drawing* DrawingStore::get(std::uint32_t id) const {
  for (const auto& d : drawings_) {
    if (d.id == id) return &d;
  }
  return nullptr;
}

std::string DrawingStore::toJSON() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("drawings");
  w.StartArray();
  for (const auto& d : drawings_) {
    w.StartObject();
    w.Key("id");   w.Uint(d.id);
    w.Key("type"); w.String(drawingTypeName(d.type));
    w.Key("points");
    w.StartArray();
    for (const auto& p : d.points) {
      w.StartObject();
      w.Key("index"); w.Double(p.logicalIndex);
      w.Key("price"); w.Double(p.price);
      w.EndObject();
    }
    w.EndArray();
    w.Key("color");
    w.StartArray();
    for (int i = 0; i < 4; ++i) w.Double(static_cast<double>(d.color[i]));
    w.EndArray();
    w.Key("lineWidth"); w.Double(static_cast<double>(d.lineWidth));
    if (d.type == DrawingType::Text) {
      w.Key("text"); w.String(d.text.c_str());
    }
    w.EndObject();
  }
  w.EndArray();
  w.EndObject();

  return sb.GetString();
}

bool DrawingStore::loadJSON(const std::string& json) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) return false;
  if (!doc.IsObject()) return false;
  if (!doc.HasMember("drawings") || !doc["drawings"].IsArray()) return false;

  const auto& arr = doc["drawings"].GetArray();

  std::vector<Drawing> loaded;
  loaded.reserve(arr.Size());
  std::uint32_t maxId = 0;

  for (const auto& v : arr) {
    if (!v.IsObject()) return false;
    Drawing d;

    // UINT32_MAX is reserved so nextId_ cannot wrap to 0.
    if (!v.HasMember("id") || !v["id"].IsUint()) return false;
    d.id = v["id"].GetUint();
    if (d.id == 0 || d.id == UINT32_MAX) return false;
    for (const auto& prev : loaded) {
      if (prev.id == d.id) return false;
    }

    if (!v.HasMember("type") || !v["type"].IsString() ||
        !parseDrawingType(v["type"].GetString(), d.type))
      return false;

    if (!v.HasMember("points") || !v["points"].IsArray()) return false;
    for (const auto& pv : v["points"].GetArray()) {
      if (!pv.IsObject() || !pv.HasMember("index") || !pv["index"].IsNumber() ||
          !pv.HasMember("price") || !pv["price"].IsNumber())
        return false;
      d.points.push_back({pv["index"].GetDouble(), pv["price"].GetDouble()});
    }

    if (v.HasMember("text") && v["text"].IsString())
      d.text = v["text"].GetString();

    if (!validate(d.type, d.points, d.text)) return false;

    if (v.HasMember("color") && v["color"].IsArray()) {
      const auto& ca = v["color"].GetArray();
      for (unsigned i = 0; i < 4 && i < ca.Size(); ++i) {
        if (ca[i].IsNumber())
          d.color[i] = static_cast<float>(ca[i].GetDouble());
      }
    }

    if (v.HasMember("lineWidth") && v["lineWidth"].IsNumber())
      d.lineWidth = static_cast<float>(v["lineWidth"].GetDouble());

    if (d.id > maxId) maxId = d.id;
    loaded.push_back(std::move(d));
  }

  drawings_ = std::move(loaded);
  nextId_ = std::max(nextId_, maxId + 1);
  return true;
}

void DrawingStore::replaceDrawings(DrawingStore&& other) {
  drawings_ = std::move(other.drawings_);
  other.drawings_.clear();
  nextId_ = std::max(nextId_, other.nextId_);
}

} // namespace sc
