#ifndef TRAIN_CATALOG_LOADER_HPP_
#define TRAIN_CATALOG_LOADER_HPP_

#include "model/train.hpp"

#include <istream>
#include <stdexcept>
#include <string>

namespace railway {
namespace catalog {

/**
 * Malformed catalog input. `line()` is 1-based, 0 when not tied to a line.
 */
class CatalogError : public std::runtime_error {
 public:
  CatalogError(size_t line, const std::string& message);

  size_t line() const { return line_; }

 private:
  size_t line_;
};

/**
 * Reads train definitions, one per line after a header:
 *
 *   id,name,SL::500;3A::1200,SL::72;3A::64,MON;WED,NDLS::New Delhi::00:00::16:00::0;...
 *
 * Pairs are separated by ';' and the fields of a pair by '::'. Stops are
 * code::name::arrival::departure::distance.
 */
class TrainCatalogLoader {
 public:
  static TrainRegistry loadFromStream(std::istream& input);

  // Throws CatalogError if the file cannot be opened.
  static TrainRegistry loadFromFile(const std::string& path);

  static std::shared_ptr<Train> parseRecord(const std::string& line, size_t line_number);
};

}  // namespace catalog
}  // namespace railway

#endif  // TRAIN_CATALOG_LOADER_HPP_
