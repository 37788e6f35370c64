#ifndef MYO_CORE_ANALYSIS_ERRORS_HPP
#define MYO_CORE_ANALYSIS_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace myo_core
{

/**
 * @brief A trace or window holds too few samples to be analysed
 *
 * Fatal for the recording being analysed. Batch analysis reports the
 * recording by name and continues with the next one.
 */
class InsufficientDataError final : public std::runtime_error
{
public:
  InsufficientDataError(const std::string& what,
                        std::size_t available,
                        std::size_t required)
    : std::runtime_error(what + ": " + std::to_string(available) +
                         " samples, need at least " +
                         std::to_string(required)),
      available_{available},
      required_{required}
  {
  }

  [[nodiscard]] std::size_t available() const { return available_; }
  [[nodiscard]] std::size_t required() const { return required_; }

private:
  std::size_t available_;
  std::size_t required_;
};

}  // namespace myo_core

#endif  // MYO_CORE_ANALYSIS_ERRORS_HPP
