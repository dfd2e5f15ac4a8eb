#include <mintgate/protocol/contract.hpp>

#include <algorithm>
#include <utility>

namespace mintgate::protocol {

response& response::add_attribute( std::string key, std::string value )
{
  attributes.emplace_back( std::move( key ), std::move( value ) );
  return *this;
}

response& response::add_message( asset_ft::msg message )
{
  messages.emplace_back( std::move( message ) );
  return *this;
}

const std::string* response::attribute_value( std::string_view key ) const noexcept
{
  auto it = std::ranges::find( attributes, key, &attribute::key );
  if( it == attributes.end() )
    return nullptr;

  return &it->value;
}

} // namespace mintgate::protocol
