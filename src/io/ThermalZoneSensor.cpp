#include "io/ThermalZoneSensor.hpp"

#include <fstream>
#include <utility>

using namespace carpark::io;

ThermalZoneSensor::ThermalZoneSensor(std::string path) : path_(std::move(path)) {}

std::optional<double> ThermalZoneSensor::read() const {
  std::ifstream in(path_);
  long milli = 0;
  if (!(in >> milli))
    return std::nullopt;
  return static_cast<double>(milli) / 1000.0;
}
