#include <mintgate/protocol/asset_ft.hpp>

#include <array>
#include <utility>

namespace mintgate::protocol::asset_ft {

static constexpr std::array< std::pair< feature, std::string_view >, 8 > feature_names{
  { { feature::minting, "minting" },
   { feature::burning, "burning" },
   { feature::freezing, "freezing" },
   { feature::whitelisting, "whitelisting" },
   { feature::ibc, "ibc" },
   { feature::block_smart_contracts, "block_smart_contracts" },
   { feature::clawback, "clawback" },
   { feature::extension, "extension" } }
};

std::string_view to_string( feature f ) noexcept
{
  for( const auto& [ value, name ]: feature_names )
    if( value == f )
      return name;

  return "unknown";
}

std::optional< feature > feature_from_string( std::string_view str ) noexcept
{
  for( const auto& [ value, name ]: feature_names )
    if( name == str )
      return value;

  return std::nullopt;
}

} // namespace mintgate::protocol::asset_ft
