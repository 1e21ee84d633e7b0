#include "sc/style/Theme.hpp"

namespace sc {

namespace {

void setColor(float* c, float r, float g, float b, float a) {
  c[0] = r; c[1] = g; c[2] = b; c[3] = a;
}

} // namespace

Theme lightTheme() {
  Theme t;
  t.name = "Light";
  // All fields already carry the light-theme defaults from the struct initializers.
  return t;
}

Theme darkTheme() {
  Theme t;
  t.name = "Dark";

  setColor(t.backgroundColor, 0.1f, 0.1f, 0.12f, 1.0f);
  setColor(t.axisGutterColor, 0.13f, 0.13f, 0.15f, 1.0f);
  setColor(t.gridColor, 0.2f, 0.2f, 0.25f, 1.0f);
  setColor(t.axisLineColor, 0.4f, 0.4f, 0.45f, 1.0f);
  setColor(t.labelColor, 0.7f, 0.7f, 0.75f, 1.0f);
  setColor(t.bollingerMiddle, 0.5f, 0.5f, 0.55f, 1.0f);
  setColor(t.overboughtBand, 0.937f, 0.325f, 0.314f, 0.12f);
  setColor(t.oversoldBand, 0.149f, 0.651f, 0.604f, 0.12f);
  return t;
}

bool themeByName(const std::string& name, Theme& out) {
  if (name == "Light") { out = lightTheme(); return true; }
  if (name == "Dark") { out = darkTheme(); return true; }
  return false;
}

} // namespace sc
