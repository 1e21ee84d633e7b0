// D3.1 - DrawingStore: chart-space annotations
// Tests: add/validate per type, remove, monotonic ids across clear,
// JSON save/load, malformed JSON leaves the store untouched,
// duplicate/reserved ids, replaceDrawings.

#include "sc/drawing/DrawingStore.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  // ---- Test 1: Add and point-count validation ----
  {
    sc::DrawingStore store;
    auto id1 = store.add(sc::DrawingType::Trendline, {{10.0, 50.0}, {50.0, 80.0}});
    requireTrue(id1 == 1, "first id is 1");
    auto id2 = store.add(sc::DrawingType::Horizontal, {{20.0, 65.0}});
    requireTrue(id2 == 2, "second id is 2");
    auto id3 = store.add(sc::DrawingType::ParallelChannel,
                         {{0.0, 10.0}, {10.0, 20.0}, {5.0, 30.0}});
    requireTrue(id3 == 3, "channel has three points");

    requireTrue(store.add(sc::DrawingType::Trendline, {{1.0, 1.0}}) == 0, "too few points");
    requireTrue(store.add(sc::DrawingType::Vertical, {{1.0, 1.0}, {2.0, 2.0}}) == 0,
                "too many points");
    requireTrue(store.add(sc::DrawingType::Text, {{1.0, 1.0}}, nullptr, "   ") == 0,
                "blank text");
    const double inf = std::numeric_limits<double>::infinity();
    requireTrue(store.add(sc::DrawingType::Segment, {{1.0, 1.0}, {inf, 2.0}}) == 0,
                "non-finite point");
    requireTrue(store.count() == 3, "rejected drawings not stored");

    const sc::Drawing* d = store.get(id1);
    requireTrue(d != nullptr, "get");
    requireTrue(d->points[1].price == 80.0, "points kept in chart space");
    requireTrue(std::fabs(d->color[2] - 0.965f) < 1e-6f, "default color");

    std::printf("  Test 1 (add/validate): PASS\n");
  }

  // ---- Test 2: Type names ----
  {
    sc::DrawingType t;
    requireTrue(sc::parseDrawingType("golden", t) && t == sc::DrawingType::GoldenRatio, "golden");
    requireTrue(sc::parseDrawingType("parallel", t) && t == sc::DrawingType::ParallelChannel,
                "parallel");
    requireTrue(!sc::parseDrawingType("circle", t), "unknown type");
    requireTrue(std::string(sc::drawingTypeName(sc::DrawingType::Fibonacci)) == "fibonacci",
                "fibonacci name");
    requireTrue(sc::pointCountFor(sc::DrawingType::Text) == 1, "text one point");

    std::printf("  Test 2 (type names): PASS\n");
  }

  // ---- Test 3: Remove and clear ----
  {
    sc::DrawingStore store;
    auto a = store.add(sc::DrawingType::Vertical, {{3.0, 0.0}});
    auto b = store.add(sc::DrawingType::Vertical, {{4.0, 0.0}});
    requireTrue(store.remove(a), "remove a");
    requireTrue(!store.remove(a), "remove twice fails");
    requireTrue(store.get(a) == nullptr, "a gone");
    requireTrue(store.get(b) != nullptr, "b kept");

    store.clear();
    requireTrue(store.count() == 0, "cleared");
    auto c = store.add(sc::DrawingType::Vertical, {{5.0, 0.0}});
    requireTrue(c == 3, "ids not reused after clear");

    std::printf("  Test 3 (remove/clear): PASS\n");
  }

  // ---- Test 4: JSON save and load ----
  {
    sc::DrawingStore store;
    const float red[4] = {1.0f, 0.0f, 0.0f, 1.0f};
    store.add(sc::DrawingType::Rectangle, {{10.0, 90.0}, {20.0, 95.0}}, red);
    store.add(sc::DrawingType::Text, {{15.0, 92.5}}, nullptr, "breakout");

    std::string json = store.toJSON();
    requireTrue(json.find("\"type\":\"rectangle\"") != std::string::npos, "type name in JSON");
    requireTrue(json.find("\"text\":\"breakout\"") != std::string::npos, "text in JSON");

    sc::DrawingStore loaded;
    requireTrue(loaded.loadJSON(json), "loadJSON");
    requireTrue(loaded.count() == 2, "two drawings loaded");
    const sc::Drawing* rect = loaded.get(1);
    requireTrue(rect && rect->type == sc::DrawingType::Rectangle, "rectangle restored");
    requireTrue(rect->color[0] == 1.0f && rect->color[1] == 0.0f, "color restored");
    const sc::Drawing* text = loaded.get(2);
    requireTrue(text && text->text == "breakout", "text restored");
    requireTrue(text->lineWidth == 2.0f, "line width restored");

    auto next = loaded.add(sc::DrawingType::Horizontal, {{0.0, 1.0}});
    requireTrue(next == 3, "ids continue after the loaded maximum");

    std::printf("  Test 4 (JSON): PASS\n");
  }

  // ---- Test 5: Malformed JSON is rejected as a whole ----
  {
    sc::DrawingStore store;
    store.add(sc::DrawingType::Horizontal, {{0.0, 1.0}});

    requireTrue(!store.loadJSON("not json"), "parse error");
    requireTrue(!store.loadJSON("{\"drawings\":5}"), "drawings not array");
    requireTrue(!store.loadJSON(
      "{\"drawings\":[{\"id\":7,\"type\":\"segment\",\"points\":[{\"index\":1,\"price\":2}]}]}"),
      "wrong point count");
    requireTrue(!store.loadJSON(
      "{\"drawings\":[{\"id\":7,\"type\":\"spiral\",\"points\":[]}]}"), "unknown type");
    requireTrue(store.count() == 1, "store untouched");

    std::printf("  Test 5 (malformed JSON): PASS\n");
  }

  // ---- Test 6: Duplicate and reserved ids are rejected ----
  {
    sc::DrawingStore store;
    store.add(sc::DrawingType::Horizontal, {{0.0, 1.0}});

    requireTrue(!store.loadJSON(
      "{\"drawings\":["
      "{\"id\":1,\"type\":\"horizontal\",\"points\":[{\"index\":1,\"price\":2}]},"
      "{\"id\":1,\"type\":\"vertical\",\"points\":[{\"index\":3,\"price\":0}]}]}"),
      "duplicate id");
    requireTrue(!store.loadJSON(
      "{\"drawings\":["
      "{\"id\":1,\"type\":\"horizontal\",\"points\":[{\"index\":1,\"price\":2}]},"
      "{\"id\":4294967295,\"type\":\"vertical\",\"points\":[{\"index\":3,\"price\":0}]}]}"),
      "id 4294967295 reserved");
    requireTrue(!store.loadJSON(
      "{\"drawings\":[{\"id\":0,\"type\":\"vertical\",\"points\":[{\"index\":3,\"price\":0}]}]}"),
      "id 0 invalid");
    requireTrue(store.count() == 1 && store.get(1) != nullptr, "store untouched");

    requireTrue(store.loadJSON(
      "{\"drawings\":[{\"id\":4294967294,\"type\":\"vertical\",\"points\":[{\"index\":3,\"price\":0}]}]}"),
      "largest usable id loads");
    requireTrue(store.add(sc::DrawingType::Vertical, {{4.0, 0.0}}) == 0,
                "reserved id is never issued");
    requireTrue(store.count() == 1, "nothing added once ids run out");

    std::printf("  Test 6 (id integrity): PASS\n");
  }

  // ---- Test 7: replaceDrawings keeps the id counter ahead ----
  {
    sc::DrawingStore live;
    for (int i = 0; i < 5; ++i)
      live.add(sc::DrawingType::Vertical, {{static_cast<double>(i), 0.0}});
    live.clear();

    sc::DrawingStore incoming;
    requireTrue(incoming.loadJSON(
      "{\"drawings\":[{\"id\":2,\"type\":\"horizontal\",\"points\":[{\"index\":1,\"price\":2}]}]}"),
      "load incoming");
    live.replaceDrawings(std::move(incoming));
    requireTrue(live.count() == 1 && live.get(2) != nullptr, "drawings taken over");
    requireTrue(live.add(sc::DrawingType::Vertical, {{9.0, 0.0}}) == 6,
                "numbering continues past ids issued before the swap");

    sc::DrawingStore ahead;
    requireTrue(ahead.loadJSON(
      "{\"drawings\":[{\"id\":40,\"type\":\"horizontal\",\"points\":[{\"index\":1,\"price\":2}]}]}"),
      "load ahead");
    live.replaceDrawings(std::move(ahead));
    requireTrue(live.add(sc::DrawingType::Vertical, {{9.0, 0.0}}) == 41,
                "numbering continues past the incoming maximum");

    std::printf("  Test 7 (replaceDrawings): PASS\n");
  }

  std::printf("D3.1 drawing_store: ALL PASS\n");
  return 0;
}
