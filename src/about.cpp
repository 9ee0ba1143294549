#include "gambit/about.hpp"

namespace gambit {

std::string library_name() {
  return "gambit";
}

std::string library_version() {
  return "0.1.0";
}

std::string about_message() {
  return library_name() + " " + library_version() + " - chess rules engine";
}

void print_about(std::ostream& os) {
  os << about_message() << '\n';
}

} // namespace gambit
