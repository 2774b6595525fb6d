#ifndef FLOATREP_CORE_VALUE_HPP
#define FLOATREP_CORE_VALUE_HPP

// ExactValue: the common currency between decimal parsing and
// quantization. Either an exact, sign-carrying rational or one of the
// three non-finite values. Immutable once built.

#include <utility>
#include <variant>

#include <gmpxx.h>

namespace floatrep {

class ExactValue {
public:
  struct PositiveInfinity {};
  struct NegativeInfinity {};
  struct NotANumber {};

  static ExactValue finite(mpq_class Value) {
    Value.canonicalize();
    return ExactValue(Storage{std::move(Value)});
  }
  static ExactValue positiveInfinity() {
    return ExactValue(Storage{PositiveInfinity{}});
  }
  static ExactValue negativeInfinity() {
    return ExactValue(Storage{NegativeInfinity{}});
  }
  static ExactValue notANumber() { return ExactValue(Storage{NotANumber{}}); }

  bool isFinite() const { return std::holds_alternative<mpq_class>(V); }
  bool isPositiveInfinity() const {
    return std::holds_alternative<PositiveInfinity>(V);
  }
  bool isNegativeInfinity() const {
    return std::holds_alternative<NegativeInfinity>(V);
  }
  bool isNaN() const { return std::holds_alternative<NotANumber>(V); }

  // The rational, or nullptr for a non-finite value.
  const mpq_class *rational() const { return std::get_if<mpq_class>(&V); }

private:
  using Storage =
      std::variant<mpq_class, PositiveInfinity, NegativeInfinity, NotANumber>;

  explicit ExactValue(Storage S) : V(std::move(S)) {}

  Storage V;
};

} // namespace floatrep

#endif // FLOATREP_CORE_VALUE_HPP
