#include "lrc/config/ChartConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cstdio>

namespace lrc {

namespace {

void addColor(rapidjson::Value& obj, const char* key, const float c[4],
              rapidjson::Document::AllocatorType& alloc) {
  rapidjson::Value arr(rapidjson::kArrayType);
  for (int i = 0; i < 4; i++) arr.PushBack(static_cast<double>(c[i]), alloc);
  obj.AddMember(rapidjson::StringRef(key), arr, alloc);
}

void readNumber(const rapidjson::Value& obj, const char* key, double& out) {
  if (obj.HasMember(key) && obj[key].IsNumber()) out = obj[key].GetDouble();
}

void readInt(const rapidjson::Value& obj, const char* key, int& out) {
  if (obj.HasMember(key) && obj[key].IsInt()) out = obj[key].GetInt();
}

void readFloat(const rapidjson::Value& obj, const char* key, float& out) {
  if (obj.HasMember(key) && obj[key].IsNumber())
    out = static_cast<float>(obj[key].GetDouble());
}

// Only a full [r,g,b,a] numeric array replaces the color.
void readColor(const rapidjson::Value& obj, const char* key, float out[4]) {
  if (!obj.HasMember(key) || !obj[key].IsArray()) return;
  const auto& arr = obj[key];
  if (arr.Size() != 4) return;
  for (rapidjson::SizeType i = 0; i < 4; i++) {
    if (!arr[i].IsNumber()) return;
  }
  for (rapidjson::SizeType i = 0; i < 4; i++)
    out[i] = static_cast<float>(arr[i].GetDouble());
}

} // namespace

std::string serializeChartConfig(const ChartConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  const auto& d = cfg.dims;
  rapidjson::Value dims(rapidjson::kObjectType);
  dims.AddMember("chartHeight", d.chartHeight, alloc);
  dims.AddMember("timescaleHeight", d.timescaleHeight, alloc);
  dims.AddMember("liquiditySectionWidth", d.liquiditySectionWidth, alloc);
  dims.AddMember("liquiditySectionOffset", d.liquiditySectionOffset, alloc);
  dims.AddMember("barHeight", d.barHeight, alloc);
  dims.AddMember("barSpacing", d.barSpacing, alloc);
  dims.AddMember("bandPaddingInner", d.bandPaddingInner, alloc);
  dims.AddMember("rangeMinHeight", d.rangeMinHeight, alloc);
  dims.AddMember("dragBoundaryMargin", d.dragBoundaryMargin, alloc);
  dims.AddMember("rangeIndicatorWidth", d.rangeIndicatorWidth, alloc);
  dims.AddMember("handleRadius", d.handleRadius, alloc);
  dims.AddMember("centerHandleWidth", d.centerHandleWidth, alloc);
  dims.AddMember("centerHandleHeight", d.centerHandleHeight, alloc);
  dims.AddMember("solidLineHeight", d.solidLineHeight, alloc);
  dims.AddMember("transparentLineHeight", d.transparentLineHeight, alloc);
  dims.AddMember("priceDotRadius", d.priceDotRadius, alloc);
  dims.AddMember("minPlotWidth", d.minPlotWidth, alloc);
  dims.AddMember("fallbackWidth", d.fallbackWidth, alloc);
  doc.AddMember("dimensions", dims, alloc);

  const auto& b = cfg.behavior;
  rapidjson::Value beh(rapidjson::kObjectType);
  beh.AddMember("zoomFactor", b.zoomFactor, alloc);
  beh.AddMember("zoomMin", b.zoomMin, alloc);
  beh.AddMember("zoomMax", b.zoomMax, alloc);
  beh.AddMember("rangePadding", b.rangePadding, alloc);
  beh.AddMember("defaultRangeLow", b.defaultRangeLow, alloc);
  beh.AddMember("defaultRangeHigh", b.defaultRangeHigh, alloc);
  beh.AddMember("wheelPanStep", b.wheelPanStep, alloc);
  beh.AddMember("measureRetries", b.measureRetries, alloc);
  beh.AddMember("measureBackoffMs", b.measureBackoffMs, alloc);
  doc.AddMember("behavior", beh, alloc);

  const auto& c = cfg.colors;
  rapidjson::Value colors(rapidjson::kObjectType);
  addColor(colors, "background", c.background, alloc);
  addColor(colors, "barActive", c.barActive, alloc);
  addColor(colors, "barInactive", c.barInactive, alloc);
  addColor(colors, "barHover", c.barHover, alloc);
  addColor(colors, "priceLineInRange", c.priceLineInRange, alloc);
  addColor(colors, "priceLineOutOfRange", c.priceLineOutOfRange, alloc);
  colors.AddMember("priceLineWidth", static_cast<double>(c.priceLineWidth), alloc);
  addColor(colors, "rangeArea", c.rangeArea, alloc);
  addColor(colors, "guideLine", c.guideLine, alloc);
  addColor(colors, "indicatorTrack", c.indicatorTrack, alloc);
  addColor(colors, "indicatorTrackFull", c.indicatorTrackFull, alloc);
  addColor(colors, "indicatorFill", c.indicatorFill, alloc);
  addColor(colors, "handleFill", c.handleFill, alloc);
  addColor(colors, "handleStroke", c.handleStroke, alloc);
  addColor(colors, "gripLine", c.gripLine, alloc);
  addColor(colors, "currentPrice", c.currentPrice, alloc);
  addColor(colors, "axisTick", c.axisTick, alloc);
  addColor(colors, "axisLabel", c.axisLabel, alloc);
  doc.AddMember("colors", colors, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool parseChartConfig(const std::string& json, ChartConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    std::fprintf(stderr, "parseChartConfig: invalid JSON (offset %zu)\n",
                 static_cast<std::size_t>(doc.GetErrorOffset()));
    return false;
  }

  ChartConfig cfg = out;

  if (doc.HasMember("dimensions") && doc["dimensions"].IsObject()) {
    const auto& v = doc["dimensions"];
    auto& d = cfg.dims;
    readNumber(v, "chartHeight", d.chartHeight);
    readNumber(v, "timescaleHeight", d.timescaleHeight);
    readNumber(v, "liquiditySectionWidth", d.liquiditySectionWidth);
    readNumber(v, "liquiditySectionOffset", d.liquiditySectionOffset);
    readNumber(v, "barHeight", d.barHeight);
    readNumber(v, "barSpacing", d.barSpacing);
    readNumber(v, "bandPaddingInner", d.bandPaddingInner);
    readNumber(v, "rangeMinHeight", d.rangeMinHeight);
    readNumber(v, "dragBoundaryMargin", d.dragBoundaryMargin);
    readNumber(v, "rangeIndicatorWidth", d.rangeIndicatorWidth);
    readNumber(v, "handleRadius", d.handleRadius);
    readNumber(v, "centerHandleWidth", d.centerHandleWidth);
    readNumber(v, "centerHandleHeight", d.centerHandleHeight);
    readNumber(v, "solidLineHeight", d.solidLineHeight);
    readNumber(v, "transparentLineHeight", d.transparentLineHeight);
    readNumber(v, "priceDotRadius", d.priceDotRadius);
    readNumber(v, "minPlotWidth", d.minPlotWidth);
    readNumber(v, "fallbackWidth", d.fallbackWidth);
  }

  if (doc.HasMember("behavior") && doc["behavior"].IsObject()) {
    const auto& v = doc["behavior"];
    auto& b = cfg.behavior;
    readNumber(v, "zoomFactor", b.zoomFactor);
    readNumber(v, "zoomMin", b.zoomMin);
    readNumber(v, "zoomMax", b.zoomMax);
    readNumber(v, "rangePadding", b.rangePadding);
    readNumber(v, "defaultRangeLow", b.defaultRangeLow);
    readNumber(v, "defaultRangeHigh", b.defaultRangeHigh);
    readNumber(v, "wheelPanStep", b.wheelPanStep);
    readInt(v, "measureRetries", b.measureRetries);
    readNumber(v, "measureBackoffMs", b.measureBackoffMs);
  }

  if (doc.HasMember("colors") && doc["colors"].IsObject()) {
    const auto& v = doc["colors"];
    auto& c = cfg.colors;
    readColor(v, "background", c.background);
    readColor(v, "barActive", c.barActive);
    readColor(v, "barInactive", c.barInactive);
    readColor(v, "barHover", c.barHover);
    readColor(v, "priceLineInRange", c.priceLineInRange);
    readColor(v, "priceLineOutOfRange", c.priceLineOutOfRange);
    readFloat(v, "priceLineWidth", c.priceLineWidth);
    readColor(v, "rangeArea", c.rangeArea);
    readColor(v, "guideLine", c.guideLine);
    readColor(v, "indicatorTrack", c.indicatorTrack);
    readColor(v, "indicatorTrackFull", c.indicatorTrackFull);
    readColor(v, "indicatorFill", c.indicatorFill);
    readColor(v, "handleFill", c.handleFill);
    readColor(v, "handleStroke", c.handleStroke);
    readColor(v, "gripLine", c.gripLine);
    readColor(v, "currentPrice", c.currentPrice);
    readColor(v, "axisTick", c.axisTick);
    readColor(v, "axisLabel", c.axisLabel);
  }

  out = cfg;
  return true;
}

} // namespace lrc
