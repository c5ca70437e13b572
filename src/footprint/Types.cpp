#include "footprint/Types.hpp"

#include <cctype>

namespace footprint {

namespace {

std::string ToLowerAscii(std::string s)
{
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

} // namespace

const char* DrawingUnitName(DrawingUnit u)
{
  switch (u) {
  case DrawingUnit::Millimeter: return "mm";
  case DrawingUnit::Centimeter: return "cm";
  case DrawingUnit::Meter: return "m";
  default: return "mm";
  }
}

bool ParseDrawingUnit(const std::string& s, DrawingUnit* out)
{
  if (!out) return false;
  const std::string k = ToLowerAscii(s);
  if (k == "mm" || k == "millimeter" || k == "millimeters" || k == "millimetre" || k == "millimetres") {
    *out = DrawingUnit::Millimeter;
    return true;
  }
  if (k == "cm" || k == "centimeter" || k == "centimeters" || k == "centimetre" || k == "centimetres") {
    *out = DrawingUnit::Centimeter;
    return true;
  }
  if (k == "m" || k == "meter" || k == "meters" || k == "metre" || k == "metres") {
    *out = DrawingUnit::Meter;
    return true;
  }
  return false;
}

DrawingUnit DrawingUnitFromInsUnits(int code)
{
  switch (code) {
  case 4: return DrawingUnit::Millimeter;
  case 5: return DrawingUnit::Centimeter;
  case 6: return DrawingUnit::Meter;
  default: return DrawingUnit::Millimeter;
  }
}

double UnitToMm(DrawingUnit u)
{
  switch (u) {
  case DrawingUnit::Millimeter: return 1.0;
  case DrawingUnit::Centimeter: return 10.0;
  case DrawingUnit::Meter: return 1000.0;
  default: return 1.0;
  }
}

} // namespace footprint
