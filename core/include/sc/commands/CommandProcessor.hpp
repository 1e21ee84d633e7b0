#pragma once
#include "sc/capture/CaptureSession.hpp"
#include "sc/ids/Id.hpp"

#include <string>

#include <rapidjson/document.h>

namespace sc {

class ChartWorkspace;

struct CmdError {
  std::string code;     // e.g. "VALIDATION_BAD_RANGE"
  std::string message;  // human text
  std::string details;  // small JSON string with fields
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
  Id createdId{0};
};

// JSON message front-end over a ChartWorkspace: one object per command,
// selected by its "cmd" field.
class CommandProcessor {
public:
  explicit CommandProcessor(ChartWorkspace& workspace);

  CmdResult applyJson(const rapidjson::Value& obj);

  // Convenience: parse string then apply.
  CmdResult applyJsonText(const std::string& jsonText);

  // Result of the most recent completed "capture" command.
  bool hasCaptureResult() const { return hasCapture_; }
  const CaptureResult& lastCaptureResult() const { return lastCapture_; }

private:
  ChartWorkspace& ws_;

  bool hasCapture_{false};
  CaptureResult lastCapture_;

  // ---- handlers ----
  CmdResult cmdSetInteractionMode(const rapidjson::Value& obj);
  CmdResult cmdJumpToRange(const rapidjson::Value& obj);
  CmdResult cmdNavigate(const std::string& cmd);
  CmdResult cmdSetRange(const rapidjson::Value& obj);
  CmdResult cmdResizePane(const rapidjson::Value& obj);
  CmdResult cmdSetIndicator(const rapidjson::Value& obj);
  CmdResult cmdAddDrawing(const rapidjson::Value& obj);
  CmdResult cmdDeleteDrawing(const rapidjson::Value& obj);
  CmdResult cmdSelectDrawing(const rapidjson::Value& obj);
  CmdResult cmdDeleteSelected(const rapidjson::Value& obj);
  CmdResult cmdClearDrawings(const rapidjson::Value& obj);
  CmdResult cmdConfirmText(const rapidjson::Value& obj);
  CmdResult cmdCancelText(const rapidjson::Value& obj);
  CmdResult cmdCapture(const rapidjson::Value& obj);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key);
  static Id getIdOrZero(const rapidjson::Value& obj, const char* key);
  static bool getNumber(const rapidjson::Value& obj, const char* key, double& out);
  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");
};

} // namespace sc
