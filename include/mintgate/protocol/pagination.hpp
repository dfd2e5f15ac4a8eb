#pragma once

#include <cstdint>
#include <optional>

#include <mintgate/protocol/serialization.hpp>
#include <mintgate/protocol/types.hpp>

namespace mintgate::protocol {

struct page_request
{
  std::optional< bytes > key;
  std::optional< std::uint64_t > offset;
  std::optional< std::uint64_t > limit;
  std::optional< bool > count_total;
  std::optional< bool > reverse;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & key;
    ar & offset;
    ar & limit;
    ar & count_total;
    ar & reverse;
  }

  bool operator==( const page_request& ) const = default;
};

struct page_response
{
  // An absent or empty key marks the final page
  std::optional< bytes > next_key;
  std::optional< std::uint64_t > total;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & next_key;
    ar & total;
  }

  bool has_next() const noexcept
  {
    return next_key.has_value() && !next_key->empty();
  }

  bool operator==( const page_response& ) const = default;
};

} // namespace mintgate::protocol
