#pragma once

#include <stdexcept>
#include <string>

namespace weasel {

enum class error_kind { configuration, sampling };

class error : public std::runtime_error {
public:
  inline error(error_kind kind, std::string const& message)
      : std::runtime_error{message}
      , kind_{kind} {
  }

  inline auto kind() const noexcept {
    return kind_;
  }

private:
  error_kind kind_;
};

inline error configuration_error(std::string const& message) {
  return error{error_kind::configuration, message};
}

inline error sampling_error(std::string const& message) {
  return error{error_kind::sampling, message};
}

} // namespace weasel
