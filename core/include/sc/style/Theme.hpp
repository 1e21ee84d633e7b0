#pragma once
#include <string>

namespace sc {

struct Theme {
  std::string name;

  // Background
  float backgroundColor[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float axisGutterColor[4] = {0.97f, 0.97f, 0.98f, 1.0f};

  // Candle colors (up = close >= open)
  float candleUp[4] = {0.937f, 0.325f, 0.314f, 1.0f};    // #ef5350
  float candleDown[4] = {0.149f, 0.651f, 0.604f, 1.0f};  // #26a69a

  // Grid/axis
  float gridColor[4] = {0.92f, 0.92f, 0.94f, 1.0f};
  float axisLineColor[4] = {0.80f, 0.80f, 0.83f, 1.0f};
  float labelColor[4] = {0.2f, 0.2f, 0.25f, 1.0f};
  float gridLineWidth{1.0f};
  int gridLines{4};

  // Moving averages: 5, 10, 20, 60, 120
  float maColors[5][4] = {
    {1.000f, 0.757f, 0.027f, 1.0f},  // #ffc107
    {0.612f, 0.153f, 0.690f, 1.0f},  // #9c27b0
    {0.129f, 0.588f, 0.953f, 1.0f},  // #2196f3
    {1.000f, 0.596f, 0.000f, 1.0f},  // #ff9800
    {0.620f, 0.620f, 0.620f, 1.0f},  // #9e9e9e
  };
  float overlayLineWidth{1.0f};

  // Bollinger
  float bollingerUpper[4] = {0.914f, 0.118f, 0.388f, 1.0f};   // #e91e63
  float bollingerMiddle[4] = {0.620f, 0.620f, 0.620f, 1.0f};
  float bollingerLower[4] = {0.298f, 0.686f, 0.314f, 1.0f};   // #4caf50

  // Volume
  float volumeUp[4] = {0.937f, 0.325f, 0.314f, 0.6f};
  float volumeDown[4] = {0.149f, 0.651f, 0.604f, 0.6f};
  float volumeMa5[4] = {1.000f, 0.596f, 0.000f, 1.0f};        // #ff9800

  // Indicators
  float macdLine[4] = {0.129f, 0.588f, 0.953f, 1.0f};         // #2196f3
  float macdSignal[4] = {1.000f, 0.596f, 0.000f, 1.0f};       // #ff9800
  float histogramUp[4] = {0.937f, 0.325f, 0.314f, 0.8f};
  float histogramDown[4] = {0.149f, 0.651f, 0.604f, 0.8f};
  float kLine[4] = {0.129f, 0.588f, 0.953f, 1.0f};            // #2196f3
  float dLine[4] = {1.000f, 0.596f, 0.000f, 1.0f};            // #ff9800
  float rsiLine[4] = {0.612f, 0.153f, 0.690f, 1.0f};          // #9c27b0
  float overboughtBand[4] = {0.937f, 0.325f, 0.314f, 0.08f};
  float oversoldBand[4] = {0.149f, 0.651f, 0.604f, 0.08f};
};

// Built-in presets
Theme lightTheme();
Theme darkTheme();

// "Light" / "Dark" (case-sensitive). Returns false for unknown names.
bool themeByName(const std::string& name, Theme& out);

} // namespace sc
