#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

#include <boost/serialization/split_free.hpp>

// Boost.Serialization only ships archive support for the boost:: vocabulary
// types, std::optional and std::variant are encoded as a tag followed by the
// contained value.
namespace boost::serialization {

template< class Archive, class T >
void save( Archive& ar, const std::optional< T >& o, const unsigned int )
{
  const bool engaged = o.has_value();
  ar << engaged;
  if( engaged )
    ar << *o;
}

template< class Archive, class T >
void load( Archive& ar, std::optional< T >& o, const unsigned int )
{
  bool engaged = false;
  ar >> engaged;
  if( !engaged )
  {
    o.reset();
    return;
  }

  T t;
  ar >> t;
  o = std::move( t );
}

template< class Archive, class T >
void serialize( Archive& ar, std::optional< T >& o, const unsigned int version )
{
  split_free( ar, o, version );
}

template< class Archive, class... Ts >
void save( Archive& ar, const std::variant< Ts... >& v, const unsigned int )
{
  const std::size_t index = v.index();
  ar << index;
  std::visit( [ & ]( const auto& alternative ) { ar << alternative; }, v );
}

namespace detail {

template< std::size_t I, class Archive, class... Ts >
void load_alternative( Archive& ar, std::variant< Ts... >& v, std::size_t index )
{
  if constexpr( I < sizeof...( Ts ) )
  {
    if( index == I )
    {
      std::variant_alternative_t< I, std::variant< Ts... > > alternative;
      ar >> alternative;
      v = std::move( alternative );
      return;
    }

    load_alternative< I + 1 >( ar, v, index );
  }
  else
    throw std::out_of_range( "variant index out of range" );
}

} // namespace detail

template< class Archive, class... Ts >
void load( Archive& ar, std::variant< Ts... >& v, const unsigned int )
{
  std::size_t index = 0;
  ar >> index;
  detail::load_alternative< 0 >( ar, v, index );
}

template< class Archive, class... Ts >
void serialize( Archive& ar, std::variant< Ts... >& v, const unsigned int version )
{
  split_free( ar, v, version );
}

} // namespace boost::serialization
