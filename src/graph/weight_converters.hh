// valgraph -- immutable value graph adaptors
//
// Copyright (C) 2026 The valgraph developers
//
// This program is free software; you can redistribute it and/or
// modify it under the terms of the GNU General Public License
// as published by the Free Software Foundation; either version 3
// of the License, or (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program. If not, see <http://www.gnu.org/licenses/>.

#ifndef WEIGHT_CONVERTERS_HH
#define WEIGHT_CONVERTERS_HH

#include <type_traits>
#include <utility>

#include <boost/type_traits/make_void.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/nvp.hpp>

namespace valgraph
{

// A weight converter is a callable taking a const reference to an edge value
// and returning its weight as a double. It must be a pure function of the
// value: the adaptors call it on every weight query, and share a single
// instance between clones.
//
// A converter is persisted together with the graph it belongs to, so it must
// also be default constructible and serializable with Boost.Serialization,
// either through a serialize() member (an empty one if it is stateless) or a
// free serialize(Archive&, Converter&, unsigned) in the converter's namespace.

template <class Converter, class Value, class = void>
struct is_weight_converter : std::false_type {};

template <class Converter, class Value>
struct is_weight_converter
    <Converter, Value,
     boost::void_t<decltype(std::declval<const Converter&>()
                            (std::declval<const Value&>()))>>
    : std::is_convertible<decltype(std::declval<const Converter&>()
                                   (std::declval<const Value&>())),
                          double> {};

namespace detail
{

template <class Converter, class = void>
struct has_member_serialize : std::false_type {};

template <class Converter>
struct has_member_serialize
    <Converter,
     boost::void_t<decltype(std::declval<Converter&>().serialize
                            (std::declval<boost::archive::binary_oarchive&>(),
                             0u))>>
    : std::true_type {};

// the non-intrusive form, found by argument dependent lookup
template <class Converter, class = void>
struct has_free_serialize : std::false_type {};

template <class Converter>
struct has_free_serialize
    <Converter,
     boost::void_t<decltype(serialize
                            (std::declval<boost::archive::binary_oarchive&>(),
                             std::declval<Converter&>(), 0u))>>
    : std::true_type {};

} // namespace detail

template <class Converter>
struct is_persistable_converter
    : std::integral_constant<bool,
                             (detail::has_member_serialize<Converter>::value ||
                              detail::has_free_serialize<Converter>::value) &&
                             std::is_default_constructible<Converter>::value>
{};

// the value is the weight
struct identity_weight
{
    template <class Value>
    double operator()(const Value& value) const
    {
        return static_cast<double>(value);
    }

    template <class Archive>
    void serialize(Archive&, const unsigned int) {}
};

// the value times a constant factor, e.g. for a change of units
class scaled_weight
{
public:
    scaled_weight() : _factor(1.) {}
    explicit scaled_weight(double factor) : _factor(factor) {}

    template <class Value>
    double operator()(const Value& value) const
    {
        return _factor * static_cast<double>(value);
    }

    double get_factor() const { return _factor; }

    template <class Archive>
    void serialize(Archive& ar, const unsigned int)
    {
        ar & boost::serialization::make_nvp("factor", _factor);
    }

private:
    double _factor;
};

// a data member of the value, e.g. the magnitude of a measurement object
template <class Value, double Value::*Member>
struct member_weight
{
    double operator()(const Value& value) const
    {
        return value.*Member;
    }

    template <class Archive>
    void serialize(Archive&, const unsigned int) {}
};

} // namespace valgraph

#endif // WEIGHT_CONVERTERS_HH
