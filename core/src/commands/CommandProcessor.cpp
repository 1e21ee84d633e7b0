#include "sc/commands/CommandProcessor.hpp"
#include "sc/session/ChartWorkspace.hpp"

#include <rapidjson/document.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace sc {

namespace {
// Drawing ids are 32-bit; wider command ids must not wrap onto them.
constexpr Id kMaxDrawingId = std::numeric_limits<std::uint32_t>::max();
} // namespace

CommandProcessor::CommandProcessor(ChartWorkspace& workspace) : ws_(workspace) {}

CmdResult CommandProcessor::fail(const std::string& code,
                                 const std::string& message,
                                 const std::string& detailsJson) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  r.createdId = 0;
  return r;
}

const rapidjson::Value* CommandProcessor::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

std::string CommandProcessor::getStringOrEmpty(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return {};
  if (v->IsString()) return v->GetString();
  return {};
}

Id CommandProcessor::getIdOrZero(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return 0;

  if (v->IsUint64()) return static_cast<Id>(v->GetUint64());
  if (v->IsInt64() && v->GetInt64() > 0) return static_cast<Id>(v->GetInt64());
  if (v->IsString()) return parseIdString(v->GetString());
  return 0;
}

bool CommandProcessor::getNumber(const rapidjson::Value& obj, const char* key, double& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsNumber()) return false;
  out = v->GetDouble();
  return std::isfinite(out);
}

CmdResult CommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "CommandProcessor: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult CommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  if (cmd == "setInteractionMode") return cmdSetInteractionMode(obj);

  // Navigation
  if (cmd == "jumpToRange") return cmdJumpToRange(obj);
  if (cmd == "resetView" || cmd == "zoomIn" || cmd == "zoomOut" ||
      cmd == "panLeft" || cmd == "panRight" ||
      cmd == "jumpToLatest" || cmd == "jumpToEarliest")
    return cmdNavigate(cmd);
  if (cmd == "setRange") return cmdSetRange(obj);

  // Panes
  if (cmd == "resizePane") return cmdResizePane(obj);
  if (cmd == "setIndicator") return cmdSetIndicator(obj);

  // Drawings
  if (cmd == "addDrawing") return cmdAddDrawing(obj);
  if (cmd == "deleteDrawing") return cmdDeleteDrawing(obj);
  if (cmd == "selectDrawing") return cmdSelectDrawing(obj);
  if (cmd == "deleteSelected") return cmdDeleteSelected(obj);
  if (cmd == "clearDrawings") return cmdClearDrawings(obj);
  if (cmd == "confirmText") return cmdConfirmText(obj);
  if (cmd == "cancelText") return cmdCancelText(obj);

  if (cmd == "capture") return cmdCapture(obj);

  return fail("UNKNOWN_COMMAND",
              "Unknown cmd",
              std::string(R"({"cmd":")") + cmd + R"("})");
}

// -------------------- handlers --------------------

CmdResult CommandProcessor::cmdSetInteractionMode(const rapidjson::Value& obj) {
  InteractionMode mode;
  const std::string modeName = getStringOrEmpty(obj, "mode");
  if (!parseInteractionMode(modeName, mode)) {
    return fail("VALIDATION_BAD_MODE", "setInteractionMode: mode must be off, select or draw",
                std::string(R"({"field":"mode"})"));
  }

  DrawingType type = DrawingType::Trendline;
  if (mode == InteractionMode::Draw) {
    if (!parseDrawingType(getStringOrEmpty(obj, "type"), type)) {
      return fail("VALIDATION_BAD_TYPE", "setInteractionMode: draw needs a drawing type",
                  std::string(R"({"field":"type"})"));
    }
  }

  ws_.setInteractionMode(mode, type);
  return CmdResult{};
}

CmdResult CommandProcessor::cmdJumpToRange(const rapidjson::Value& obj) {
  const auto* v = getMember(obj, "days");
  if (!v || !v->IsInt() || v->GetInt() < 0) {
    return fail("VALIDATION_BAD_DAYS", "jumpToRange: days must be a non-negative integer",
                std::string(R"({"field":"days"})"));
  }
  if (!ws_.jumpToRange(v->GetInt())) {
    return fail("NOT_READY", "jumpToRange: no data or primary pane not measured");
  }
  return CmdResult{};
}

CmdResult CommandProcessor::cmdNavigate(const std::string& cmd) {
  bool ok = false;
  if (cmd == "resetView") ok = ws_.resetView();
  else if (cmd == "zoomIn") ok = ws_.zoomIn();
  else if (cmd == "zoomOut") ok = ws_.zoomOut();
  else if (cmd == "panLeft") ok = ws_.panLeft();
  else if (cmd == "panRight") ok = ws_.panRight();
  else if (cmd == "jumpToLatest") ok = ws_.jumpToLatest();
  else if (cmd == "jumpToEarliest") ok = ws_.jumpToEarliest();

  if (!ok) {
    return fail("NOT_READY", cmd + ": chart not ready",
                std::string(R"({"cmd":")") + cmd + R"("})");
  }
  return CmdResult{};
}

CmdResult CommandProcessor::cmdSetRange(const rapidjson::Value& obj) {
  const Id paneId = getIdOrZero(obj, "paneId");
  if (paneId == 0 || !ws_.pane(paneId)) {
    return fail("NOT_FOUND", "setRange: unknown paneId",
                std::string(R"({"paneId":)") + std::to_string(paneId) + "}");
  }

  LogicalRange r;
  if (!getNumber(obj, "from", r.from) || !getNumber(obj, "to", r.to) || !r.valid()) {
    return fail("VALIDATION_BAD_RANGE", "setRange: need finite from < to");
  }
  if (!ws_.setRange(paneId, r)) {
    return fail("VALIDATION_BAD_RANGE", "setRange: range rejected");
  }
  return CmdResult{};
}

CmdResult CommandProcessor::cmdResizePane(const rapidjson::Value& obj) {
  const Id paneId = getIdOrZero(obj, "paneId");
  if (paneId == 0 || !ws_.pane(paneId)) {
    return fail("NOT_FOUND", "resizePane: unknown paneId",
                std::string(R"({"paneId":)") + std::to_string(paneId) + "}");
  }

  const auto* w = getMember(obj, "width");
  const auto* h = getMember(obj, "height");
  if (!w || !h || !w->IsInt() || !h->IsInt() || w->GetInt() < 0 || h->GetInt() < 0) {
    return fail("VALIDATION_BAD_SIZE", "resizePane: width and height must be non-negative integers");
  }

  ws_.resizePane(paneId, w->GetInt(), h->GetInt());
  return CmdResult{};
}

CmdResult CommandProcessor::cmdSetIndicator(const rapidjson::Value& obj) {
  PaneKind kind;
  if (!parsePaneKind(getStringOrEmpty(obj, "kind"), kind) ||
      kind == PaneKind::Price || kind == PaneKind::Volume) {
    return fail("VALIDATION_BAD_KIND", "setIndicator: kind must be macd, kd or rsi",
                std::string(R"({"field":"kind"})"));
  }
  if (!ws_.setIndicator(kind)) {
    return fail("NOT_READY", "setIndicator: capture in progress");
  }
  return CmdResult{};
}

CmdResult CommandProcessor::cmdAddDrawing(const rapidjson::Value& obj) {
  DrawingType type;
  if (!parseDrawingType(getStringOrEmpty(obj, "type"), type)) {
    return fail("VALIDATION_BAD_TYPE", "addDrawing: unknown type",
                std::string(R"({"field":"type"})"));
  }

  const auto* pts = getMember(obj, "points");
  if (!pts || !pts->IsArray()) {
    return fail("VALIDATION_BAD_POINTS", "addDrawing: points must be an array",
                std::string(R"({"field":"points"})"));
  }

  // Accepts {"index":i,"price":p} or [i, p].
  std::vector<ChartPoint> points;
  for (const auto& pv : pts->GetArray()) {
    ChartPoint cp;
    if (pv.IsObject()) {
      if (!getNumber(pv, "index", cp.logicalIndex) || !getNumber(pv, "price", cp.price))
        return fail("VALIDATION_BAD_POINTS", "addDrawing: point needs numeric index and price");
    } else if (pv.IsArray() && pv.Size() == 2 && pv[0].IsNumber() && pv[1].IsNumber()) {
      cp.logicalIndex = pv[0].GetDouble();
      cp.price = pv[1].GetDouble();
    } else {
      return fail("VALIDATION_BAD_POINTS", "addDrawing: malformed point");
    }
    points.push_back(cp);
  }

  std::uint32_t id = ws_.addDrawing(type, std::move(points), getStringOrEmpty(obj, "text"));
  if (id == 0) {
    return fail("VALIDATION_BAD_DRAWING", "addDrawing: wrong point count, bad coordinates or blank text",
                std::string(R"({"type":")") + drawingTypeName(type) + R"("})");
  }

  CmdResult r;
  r.ok = true;
  r.createdId = id;
  return r;
}

CmdResult CommandProcessor::cmdDeleteDrawing(const rapidjson::Value& obj) {
  const Id id = getIdOrZero(obj, "id");
  if (id == 0 || id > kMaxDrawingId) {
    return fail("BAD_COMMAND", "deleteDrawing: missing/invalid id");
  }
  if (!ws_.deleteDrawing(static_cast<std::uint32_t>(id))) {
    return fail("NOT_FOUND", "deleteDrawing: id does not exist",
                std::string(R"({"id":)") + std::to_string(id) + "}");
  }
  return CmdResult{};
}

CmdResult CommandProcessor::cmdSelectDrawing(const rapidjson::Value& obj) {
  // null or absent clears the selection
  const auto* v = getMember(obj, "id");
  Id id = 0;
  if (v && !v->IsNull()) {
    id = getIdOrZero(obj, "id");
    if (id == 0 || id > kMaxDrawingId) return fail("BAD_COMMAND", "selectDrawing: invalid id");
  }

  if (!ws_.selectDrawing(static_cast<std::uint32_t>(id))) {
    return fail("NOT_FOUND", "selectDrawing: id does not exist",
                std::string(R"({"id":)") + std::to_string(id) + "}");
  }
  return CmdResult{};
}

CmdResult CommandProcessor::cmdDeleteSelected(const rapidjson::Value&) {
  if (!ws_.deleteSelected()) {
    return fail("NOT_FOUND", "deleteSelected: nothing selected");
  }
  return CmdResult{};
}

CmdResult CommandProcessor::cmdClearDrawings(const rapidjson::Value&) {
  ws_.clearDrawings();
  return CmdResult{};
}

CmdResult CommandProcessor::cmdConfirmText(const rapidjson::Value& obj) {
  if (!ws_.drawings().interaction().isTextPending()) {
    return fail("NOT_READY", "confirmText: no text input open");
  }

  CmdResult r;
  r.createdId = ws_.confirmText(getStringOrEmpty(obj, "text"));
  return r;
}

CmdResult CommandProcessor::cmdCancelText(const rapidjson::Value&) {
  ws_.cancelText();
  return CmdResult{};
}

CmdResult CommandProcessor::cmdCapture(const rapidjson::Value& obj) {
  const std::string target = getStringOrEmpty(obj, "targetDate");

  // A rejected capture calls back before returning; a scheduled one
  // completes on the next render tick.
  bool scheduled = ws_.capture(target, [this](const CaptureResult& result) {
    lastCapture_ = result;
    hasCapture_ = true;
  });
  if (scheduled) return CmdResult{};

  if (lastCapture_.error == "capture in progress") {
    return fail("NOT_READY", "capture: already in progress");
  }
  return fail("NOT_FOUND", "capture: " + lastCapture_.error,
              std::string(R"({"targetDate":")") + target + R"("})");
}

} // namespace sc
