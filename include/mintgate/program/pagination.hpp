#pragma once

#include <concepts>
#include <cstdint>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

#include <mintgate/program/error.hpp>
#include <mintgate/protocol/pagination.hpp>

namespace mintgate::program {

struct pagination_options
{
  // Zero disables the limit
  std::uint64_t max_page_count = 1'024;
  std::optional< std::uint64_t > page_limit;
};

template< typename Item >
struct page
{
  std::vector< Item > items;
  protocol::page_response pagination;
};

template< typename Fetch, typename Item >
concept PageSource = std::invocable< Fetch&, std::optional< protocol::page_request > >
                     && std::same_as< std::invoke_result_t< Fetch&, std::optional< protocol::page_request > >,
                                      result< page< Item > > >;

/**
 * Pulls pages from an upstream source on demand.
 *
 * The first request carries no continuation key, every following request
 * carries the key reported by the previous page. The sequence ends when a
 * page reports no continuation key and cannot be restarted.
 */
template< typename Item, PageSource< Item > Fetch >
class pager final
{
public:
  pager( Fetch fetch, pagination_options options ):
      _fetch( std::move( fetch ) ),
      _options( std::move( options ) )
  {}

  bool done() const noexcept
  {
    return _done;
  }

  std::uint64_t pages() const noexcept
  {
    return _pages;
  }

  const std::optional< protocol::bytes >& continuation() const noexcept
  {
    return _continuation;
  }

  result< page< Item > > next()
  {
    if( _done )
      return std::unexpected( program_errc::no_more_pages );

    if( _options.max_page_count && _pages >= _options.max_page_count )
      return std::unexpected( program_errc::resource_exhausted );

    std::optional< protocol::page_request > request;
    if( _continuation || _options.page_limit )
    {
      request.emplace();
      request->key   = _continuation;
      request->limit = _options.page_limit;
    }

    auto current = _fetch( std::move( request ) );
    if( !current )
      return current;

    ++_pages;

    if( current->pagination.has_next() )
      _continuation = current->pagination.next_key;
    else
    {
      _continuation.reset();
      _done = true;
    }

    return current;
  }

private:
  Fetch _fetch;
  pagination_options _options;
  std::optional< protocol::bytes > _continuation;
  std::uint64_t _pages = 0;
  bool _done           = false;
};

/**
 * Drains every page of a paginated upstream query into a single page.
 *
 * Items keep the order in which the upstream returned them. The pagination
 * metadata of the result is that of the last page received.
 */
template< typename Item, PageSource< Item > Fetch >
result< page< Item > > paginate( Fetch fetch, const pagination_options& options )
{
  pager< Item, Fetch > source( std::move( fetch ), options );
  page< Item > accumulated;

  while( !source.done() )
  {
    auto current = source.next();
    if( !current )
      return std::unexpected( current.error() );

    accumulated.items.insert( accumulated.items.end(),
                              std::make_move_iterator( current->items.begin() ),
                              std::make_move_iterator( current->items.end() ) );
    accumulated.pagination = std::move( current->pagination );
  }

  return accumulated;
}

} // namespace mintgate::program
