#include <mintgate/host/asset_ft_ledger.hpp>

#include <algorithm>
#include <limits>
#include <vector>

#include <mintgate/log.hpp>
#include <mintgate/memory.hpp>
#include <mintgate/program/identity_store.hpp>

namespace mintgate::host {

namespace {

template< class... Ts >
struct overloaded: Ts...
{
  using Ts::operator()...;
};

constexpr std::size_t max_subunit_length = 51;

bool valid_subunit( std::string_view subunit ) noexcept
{
  if( subunit.empty() || subunit.size() > max_subunit_length )
    return false;

  if( subunit.front() < 'a' || subunit.front() > 'z' )
    return false;

  return std::ranges::all_of( subunit,
                              []( char c )
                              {
                                return ( c >= 'a' && c <= 'z' ) || ( c >= '0' && c <= '9' ) || c == '/' || c == ':'
                                       || c == '.' || c == '_';
                              } );
}

bool enabled( const protocol::asset_ft::token& token, protocol::asset_ft::feature f ) noexcept
{
  return std::ranges::find( token.features, f ) != token.features.end();
}

protocol::bytes to_key( std::string_view str )
{
  const auto bytes = memory::as_bytes( str );
  return protocol::bytes( bytes.begin(), bytes.end() );
}

/*
 * Cuts one page out of entries ordered by key. A continuation key resumes at
 * the first entry not less than it, an offset is only honored without a key.
 */
template< typename Item >
std::pair< std::vector< Item >, protocol::page_response >
cut_page( const std::vector< std::pair< std::string, Item > >& entries,
          const std::optional< protocol::page_request >& request,
          std::uint64_t page_size )
{
  std::size_t begin  = 0;
  std::uint64_t size = page_size;
  bool count_total   = false;

  if( request )
  {
    if( request->key && !request->key->empty() )
    {
      const auto key = memory::as_string_view( *request->key );
      auto it        = std::ranges::lower_bound( entries, key, std::less<>{}, []( const auto& e ) -> std::string_view {
        return e.first;
      } );
      begin          = static_cast< std::size_t >( std::distance( entries.begin(), it ) );
    }
    else if( request->offset )
      begin = static_cast< std::size_t >( std::min< std::uint64_t >( *request->offset, entries.size() ) );

    if( request->limit && *request->limit )
      size = *request->limit;

    count_total = request->count_total.value_or( false );
  }

  const auto remaining = entries.size() - begin;
  const auto end       = begin + static_cast< std::size_t >( std::min< std::uint64_t >( size, remaining ) );

  std::vector< Item > items;
  items.reserve( end - begin );
  for( auto i = begin; i < end; ++i )
    items.push_back( entries[ i ].second );

  protocol::page_response pagination;
  if( end < entries.size() )
    pagination.next_key = to_key( entries[ end ].first );

  if( count_total )
    pagination.total = entries.size();

  return { std::move( items ), std::move( pagination ) };
}

} // namespace

asset_ft_ledger::asset_ft_ledger( std::uint64_t page_size ):
    _page_size( page_size ? page_size : 1 )
{}

void asset_ft_ledger::set_params( protocol::asset_ft::params params )
{
  _params = std::move( params );
}

std::uint64_t asset_ft_ledger::page_size() const noexcept
{
  return _page_size;
}

protocol::amount asset_ft_ledger::get( const balances& source,
                                       const protocol::address& account,
                                       const std::string& denom )
{
  auto it = source.find( balance_key{ account, denom } );
  if( it == source.end() )
    return 0;

  return it->second;
}

protocol::amount asset_ft_ledger::balance_of( const protocol::address& account, const std::string& denom ) const
{
  return get( _balances, account, denom );
}

protocol::amount asset_ft_ledger::supply_of( const std::string& denom ) const
{
  auto it = _supply.find( denom );
  if( it == _supply.end() )
    return 0;

  return it->second;
}

std::error_code asset_ft_ledger::apply( const protocol::address& sender, const protocol::asset_ft::msg& message )
{
  return std::visit(
    overloaded{
      [ & ]( const protocol::asset_ft::issue& m ) { return issue( sender, m ); },
      [ & ]( const protocol::asset_ft::mint& m ) { return mint( sender, m ); },
      [ & ]( const protocol::asset_ft::burn& m ) { return burn( sender, m ); },
      [ & ]( const protocol::asset_ft::freeze& m ) { return freeze( sender, m ); },
      [ & ]( const protocol::asset_ft::unfreeze& m ) { return unfreeze( sender, m ); },
      [ & ]( const protocol::asset_ft::set_frozen& m ) { return set_frozen( sender, m ); },
      [ & ]( const protocol::asset_ft::globally_freeze& m ) { return set_global_freeze( sender, m.denom, true ); },
      [ & ]( const protocol::asset_ft::globally_unfreeze& m ) { return set_global_freeze( sender, m.denom, false ); },
      [ & ]( const protocol::asset_ft::set_whitelisted_limit& m ) { return set_whitelisted_limit( sender, m ); } },
    message );
}

program::result< const protocol::asset_ft::token* >
asset_ft_ledger::administered_token( const protocol::address& sender,
                                     const std::string& denom,
                                     protocol::asset_ft::feature required ) const
{
  auto it = _tokens.find( denom );
  if( it == _tokens.end() )
    return std::unexpected( asset_ft_errc::token_not_found );

  if( it->second.issuer != sender )
    return std::unexpected( asset_ft_errc::unauthorized );

  if( !enabled( it->second, required ) )
    return std::unexpected( asset_ft_errc::feature_disabled );

  return &it->second;
}

std::error_code asset_ft_ledger::issue( const protocol::address& sender, const protocol::asset_ft::issue& msg )
{
  if( msg.symbol.empty() || !valid_subunit( msg.subunit ) )
    return asset_ft_errc::invalid_denom;

  auto denom = program::make_denomination( msg.subunit, sender );
  if( _tokens.contains( denom ) )
    return asset_ft_errc::token_exists;

  protocol::asset_ft::token token;
  token.denom                = denom;
  token.issuer               = sender;
  token.symbol               = msg.symbol;
  token.subunit              = msg.subunit;
  token.precision            = msg.precision;
  token.description          = msg.description.value_or( std::string{} );
  token.features             = msg.features.value_or( std::vector< protocol::asset_ft::feature >{} );
  token.burn_rate            = msg.burn_rate.value_or( "0" );
  token.send_commission_rate = msg.send_commission_rate.value_or( "0" );
  token.uri                  = msg.uri.value_or( std::string{} );
  token.uri_hash             = msg.uri_hash.value_or( std::string{} );
  token.version              = 1;

  _tokens.emplace( denom, std::move( token ) );
  _supply[ denom ] = msg.initial_amount;

  if( msg.initial_amount )
    _balances[ balance_key{ sender, denom } ] = msg.initial_amount;

  LOG_DEBUG( mintgate::log::instance(), "Issued {} to {} with supply {}", denom, sender, msg.initial_amount );
  return asset_ft_errc::ok;
}

std::error_code asset_ft_ledger::mint( const protocol::address& sender, const protocol::asset_ft::mint& msg )
{
  auto token = administered_token( sender, msg.coin.denom, protocol::asset_ft::feature::minting );
  if( !token )
    return token.error();

  if( !msg.coin.value )
    return asset_ft_errc::invalid_amount;

  const auto& recipient = msg.recipient ? *msg.recipient : sender;
  if( recipient.empty() )
    return asset_ft_errc::invalid_account;

  auto supply = supply_of( msg.coin.denom );
  if( std::numeric_limits< protocol::amount >::max() - msg.coin.value < supply )
    return asset_ft_errc::overflow;

  auto to_balance = balance_of( recipient, msg.coin.denom );

  if( enabled( **token, protocol::asset_ft::feature::whitelisting ) && recipient != ( *token )->issuer )
  {
    if( to_balance + msg.coin.value > get( _whitelisted, recipient, msg.coin.denom ) )
      return asset_ft_errc::whitelisted_limit_exceeded;
  }

  _supply[ msg.coin.denom ]                             = supply + msg.coin.value;
  _balances[ balance_key{ recipient, msg.coin.denom } ] = to_balance + msg.coin.value;
  return asset_ft_errc::ok;
}

std::error_code asset_ft_ledger::burn( const protocol::address& sender, const protocol::asset_ft::burn& msg )
{
  auto it = _tokens.find( msg.coin.denom );
  if( it == _tokens.end() )
    return asset_ft_errc::token_not_found;

  const auto& token = it->second;
  const bool admin  = token.issuer == sender;

  if( !admin && !enabled( token, protocol::asset_ft::feature::burning ) )
    return asset_ft_errc::feature_disabled;

  if( !msg.coin.value )
    return asset_ft_errc::invalid_amount;

  auto from_balance = balance_of( sender, msg.coin.denom );
  auto spendable    = from_balance;

  if( !admin )
  {
    if( token.globally_frozen )
      return asset_ft_errc::globally_frozen;

    auto frozen = get( _frozen, sender, msg.coin.denom );
    spendable   = frozen < from_balance ? protocol::amount( from_balance - frozen ) : protocol::amount( 0 );
  }

  if( spendable < msg.coin.value )
    return asset_ft_errc::insufficient_balance;

  auto supply = supply_of( msg.coin.denom );
  if( supply < msg.coin.value )
    return asset_ft_errc::insufficient_balance;

  _supply[ msg.coin.denom ]                          = supply - msg.coin.value;
  _balances[ balance_key{ sender, msg.coin.denom } ] = from_balance - msg.coin.value;
  return asset_ft_errc::ok;
}

std::error_code asset_ft_ledger::freeze( const protocol::address& sender, const protocol::asset_ft::freeze& msg )
{
  auto token = administered_token( sender, msg.coin.denom, protocol::asset_ft::feature::freezing );
  if( !token )
    return token.error();

  if( msg.account.empty() || msg.account == ( *token )->issuer )
    return asset_ft_errc::invalid_account;

  if( !msg.coin.value )
    return asset_ft_errc::invalid_amount;

  auto frozen = get( _frozen, msg.account, msg.coin.denom );
  if( std::numeric_limits< protocol::amount >::max() - msg.coin.value < frozen )
    return asset_ft_errc::overflow;

  _frozen[ balance_key{ msg.account, msg.coin.denom } ] = frozen + msg.coin.value;
  return asset_ft_errc::ok;
}

std::error_code asset_ft_ledger::unfreeze( const protocol::address& sender, const protocol::asset_ft::unfreeze& msg )
{
  auto token = administered_token( sender, msg.coin.denom, protocol::asset_ft::feature::freezing );
  if( !token )
    return token.error();

  if( msg.account.empty() )
    return asset_ft_errc::invalid_account;

  if( !msg.coin.value )
    return asset_ft_errc::invalid_amount;

  auto frozen = get( _frozen, msg.account, msg.coin.denom );
  if( frozen < msg.coin.value )
    return asset_ft_errc::insufficient_frozen_balance;

  _frozen[ balance_key{ msg.account, msg.coin.denom } ] = frozen - msg.coin.value;
  return asset_ft_errc::ok;
}

std::error_code asset_ft_ledger::set_frozen( const protocol::address& sender,
                                             const protocol::asset_ft::set_frozen& msg )
{
  auto token = administered_token( sender, msg.coin.denom, protocol::asset_ft::feature::freezing );
  if( !token )
    return token.error();

  if( msg.account.empty() || msg.account == ( *token )->issuer )
    return asset_ft_errc::invalid_account;

  _frozen[ balance_key{ msg.account, msg.coin.denom } ] = msg.coin.value;
  return asset_ft_errc::ok;
}

std::error_code asset_ft_ledger::set_global_freeze( const protocol::address& sender,
                                                    const std::string& denom,
                                                    bool frozen )
{
  auto token = administered_token( sender, denom, protocol::asset_ft::feature::freezing );
  if( !token )
    return token.error();

  _tokens.at( denom ).globally_frozen = frozen;
  return asset_ft_errc::ok;
}

std::error_code asset_ft_ledger::set_whitelisted_limit( const protocol::address& sender,
                                                        const protocol::asset_ft::set_whitelisted_limit& msg )
{
  auto token = administered_token( sender, msg.coin.denom, protocol::asset_ft::feature::whitelisting );
  if( !token )
    return token.error();

  if( msg.account.empty() || msg.account == ( *token )->issuer )
    return asset_ft_errc::invalid_account;

  _whitelisted[ balance_key{ msg.account, msg.coin.denom } ] = msg.coin.value;
  return asset_ft_errc::ok;
}

program::result< protocol::asset_ft::query_response >
asset_ft_ledger::query( const protocol::asset_ft::query& request ) const
{
  using namespace protocol::asset_ft;
  using response = program::result< query_response >;

  return std::visit(
    overloaded{
      [ & ]( const params_request& ) -> response { return params_response{ .params = _params }; },
      [ & ]( const token_request& r ) -> response
      {
        auto it = _tokens.find( r.denom );
        if( it == _tokens.end() )
          return std::unexpected( asset_ft_errc::token_not_found );

        return token_response{ .token = it->second };
      },
      [ & ]( const tokens_request& r ) -> response { return tokens( r ); },
      [ & ]( const balance_request& r ) -> response
      {
        if( r.account.empty() )
          return std::unexpected( asset_ft_errc::invalid_account );

        return balance_response{ .balance     = get( _balances, r.account, r.denom ),
                                 .whitelisted = get( _whitelisted, r.account, r.denom ),
                                 .frozen      = get( _frozen, r.account, r.denom ),
                                 .locked      = 0 };
      },
      [ & ]( const frozen_balance_request& r ) -> response
      {
        if( r.account.empty() )
          return std::unexpected( asset_ft_errc::invalid_account );

        return frozen_balance_response{ .balance = protocol::make_coin( get( _frozen, r.account, r.denom ), r.denom ) };
      },
      [ & ]( const frozen_balances_request& r ) -> response
      {
        if( r.account.empty() )
          return std::unexpected( asset_ft_errc::invalid_account );

        auto [ items, pagination ] = account_coins( _frozen, r.account, r.pagination );
        return frozen_balances_response{ .pagination = std::move( pagination ), .balances = std::move( items ) };
      },
      [ & ]( const whitelisted_balance_request& r ) -> response
      {
        if( r.account.empty() )
          return std::unexpected( asset_ft_errc::invalid_account );

        return whitelisted_balance_response{
          .balance = protocol::make_coin( get( _whitelisted, r.account, r.denom ), r.denom ) };
      },
      [ & ]( const whitelisted_balances_request& r ) -> response
      {
        if( r.account.empty() )
          return std::unexpected( asset_ft_errc::invalid_account );

        auto [ items, pagination ] = account_coins( _whitelisted, r.account, r.pagination );
        return whitelisted_balances_response{ .pagination = std::move( pagination ), .balances = std::move( items ) };
      } },
    request );
}

protocol::asset_ft::tokens_response asset_ft_ledger::tokens( const protocol::asset_ft::tokens_request& request ) const
{
  std::vector< std::pair< std::string, protocol::asset_ft::token > > entries;
  for( const auto& [ denom, token ]: _tokens )
    if( token.issuer == request.issuer )
      entries.emplace_back( denom, token );

  auto [ items, pagination ] = cut_page( entries, request.pagination, _page_size );
  return protocol::asset_ft::tokens_response{ .pagination = std::move( pagination ), .tokens = std::move( items ) };
}

std::pair< std::vector< protocol::coin >, protocol::page_response >
asset_ft_ledger::account_coins( const balances& source,
                                const protocol::address& account,
                                const std::optional< protocol::page_request >& pagination ) const
{
  std::vector< std::pair< std::string, protocol::coin > > entries;
  for( auto it = source.lower_bound( balance_key{ account, std::string{} } );
       it != source.end() && it->first.first == account;
       ++it )
  {
    if( it->second )
      entries.emplace_back( it->first.second, protocol::make_coin( it->second, it->first.second ) );
  }

  return cut_page( entries, pagination, _page_size );
}

} // namespace mintgate::host
