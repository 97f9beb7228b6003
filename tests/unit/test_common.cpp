#include "test_common.hpp"

#include <cassert>
#include <stdexcept>
#include <string>

#include "txengine/common/spsc_ring.hpp"
#include "txengine/common/types.hpp"

namespace txengine::tests {

void test_amount_parse() {
  using common::Amount;

  assert(Amount::parse("1.0")->units() == 10'000);
  assert(Amount::parse("20.5")->units() == 205'000);
  assert(Amount::parse("0")->units() == 0);
  assert(Amount::parse(".25")->units() == 2'500);
  assert(Amount::parse("3.")->units() == 30'000);
  assert(Amount::parse("1.2345")->units() == 12'345);
  assert(Amount::parse("-2.5")->units() == -25'000);

  // Fifth fractional digit rounds half away from zero.
  assert(Amount::parse("1.00005")->units() == 10'001);
  assert(Amount::parse("1.00004999")->units() == 10'000);
  assert(Amount::parse("-1.00005")->units() == -10'001);

  assert(!Amount::parse(""));
  assert(!Amount::parse("."));
  assert(!Amount::parse("-"));
  assert(!Amount::parse("1.2.3"));
  assert(!Amount::parse("abc"));
  assert(!Amount::parse("1e5"));
  assert(!Amount::parse("99999999999999999999"));
}

void test_amount_format() {
  using common::Amount;

  assert(Amount::from_units(255'000).to_string() == "25.5");
  assert(Amount{}.to_string() == "0.0");
  assert(Amount::from_whole(35).to_string() == "35.0");
  assert(Amount::from_whole(-5).to_string() == "-5.0");
  assert(Amount::from_units(-5'000).to_string() == "-0.5");
  assert(Amount::from_units(12'345).to_string() == "1.2345");
  assert(Amount::from_units(10'010).to_string() == "1.001");

  const auto sum = Amount::from_whole(10) + Amount::from_units(5'000) - Amount::from_whole(3);
  assert(sum == Amount::from_units(75'000));
  assert(Amount::from_whole(1) < Amount::from_whole(2));
  assert((Amount::from_whole(1) - Amount::from_whole(2)).is_negative());
}

void test_amount_overflow() {
  using common::Amount;

  const auto largest = *Amount::parse("922337203685476");
  const auto smallest = *Amount::parse("-922337203685476");

  bool threw = false;
  try {
    static_cast<void>(largest + largest);
  } catch (const std::overflow_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    static_cast<void>(smallest - largest);
  } catch (const std::overflow_error&) {
    threw = true;
  }
  assert(threw);

  // A failed update leaves the left-hand side untouched.
  auto balance = largest;
  threw = false;
  try {
    balance += Amount::from_whole(1);
  } catch (const std::overflow_error&) {
    threw = true;
  }
  assert(threw);
  assert(balance == largest);

  assert(largest - largest == Amount{});
  assert((smallest + largest) == Amount{});
}

void test_spsc_ring() {
  common::SpscRing<int> ring(4);
  assert(ring.empty());
  assert(ring.capacity() == 4);

  int value = 1;
  assert(ring.try_push(value));
  value = 2;
  assert(ring.try_push(value));
  value = 3;
  assert(ring.try_push(value));
  value = 4;
  assert(!ring.try_push(value));  // one slot stays free

  assert(*ring.try_pop() == 1);
  assert(*ring.try_pop() == 2);
  assert(*ring.try_pop() == 3);
  assert(!ring.try_pop());
  assert(ring.empty());

  bool threw = false;
  try {
    common::SpscRing<int> bad(6);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

}  // namespace txengine::tests
