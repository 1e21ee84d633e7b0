#include "sc/session/ChartState.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace sc {

std::string serializeChartState(const ChartState& state) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version", rapidjson::Value(state.version.c_str(), alloc), alloc);

  if (state.hasRange) {
    rapidjson::Value range(rapidjson::kObjectType);
    range.AddMember("from", state.range.from, alloc);
    range.AddMember("to", state.range.to, alloc);
    doc.AddMember("range", range, alloc);
  }

  doc.AddMember("indicator", rapidjson::Value(state.indicator.c_str(), alloc), alloc);

  // Embedded as an object, not a string
  if (!state.drawingsJSON.empty()) {
    rapidjson::Document drawDoc;
    drawDoc.Parse(state.drawingsJSON.c_str());
    if (!drawDoc.HasParseError()) {
      rapidjson::Value drawCopy(drawDoc, alloc);
      doc.AddMember("drawings", drawCopy, alloc);
    }
  }

  doc.AddMember("theme", rapidjson::Value(state.themeName.c_str(), alloc), alloc);
  doc.AddMember("symbol", rapidjson::Value(state.symbol.c_str(), alloc), alloc);
  doc.AddMember("period", rapidjson::Value(state.period.c_str(), alloc), alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeChartState(const std::string& json, ChartState& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  if (doc.HasMember("version") && doc["version"].IsString())
    out.version = doc["version"].GetString();

  if (doc.HasMember("range") && doc["range"].IsObject()) {
    const auto& r = doc["range"];
    if (r.HasMember("from") && r["from"].IsNumber() &&
        r.HasMember("to") && r["to"].IsNumber()) {
      LogicalRange range{r["from"].GetDouble(), r["to"].GetDouble()};
      if (!range.valid()) return false;
      out.range = range;
      out.hasRange = true;
    }
  }

  if (doc.HasMember("indicator") && doc["indicator"].IsString())
    out.indicator = doc["indicator"].GetString();

  if (doc.HasMember("drawings") && doc["drawings"].IsObject()) {
    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
    doc["drawings"].Accept(writer);
    out.drawingsJSON = sb.GetString();
  }

  if (doc.HasMember("theme") && doc["theme"].IsString())
    out.themeName = doc["theme"].GetString();
  if (doc.HasMember("symbol") && doc["symbol"].IsString())
    out.symbol = doc["symbol"].GetString();
  if (doc.HasMember("period") && doc["period"].IsString())
    out.period = doc["period"].GetString();

  return true;
}

} // namespace sc
