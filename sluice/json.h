#ifndef __SLUICE_JSON_H__
#define __SLUICE_JSON_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include <boost/type_traits.hpp>
#include <boost/utility/enable_if.hpp>
#include <boost/variant.hpp>

namespace Sluice {
namespace JSON {

class Value;

typedef std::map<std::string, Value> Object;
typedef std::vector<Value> Array;
typedef boost::variant<boost::blank, bool, long long, double, std::string,
    Array, Object> ValueBase;

namespace detail {
// Every integer is held as a long long and every floating point value as a
// double; anything else is held as itself
template <class T, class Enable = void>
struct Held { typedef T type; };
template <class T>
struct Held<T, typename boost::enable_if<boost::is_integral<T> >::type>
{ typedef long long type; };
template <class T>
struct Held<T, typename boost::enable_if<boost::is_floating_point<T> >::type>
{ typedef double type; };
template <>
struct Held<bool> { typedef bool type; };
}

/// A JSON document; default constructed it is null
///
/// get<T>() throws boost::bad_get if the Value holds something else.
class Value : public ValueBase
{
public:
    Value() {}
    Value(const Value &copy) : ValueBase(static_cast<const ValueBase &>(copy))
    {}
    template <class T>
    Value(const T &value)
        : ValueBase(static_cast<typename detail::Held<T>::type>(value))
    {}

    Value &operator=(const Value &rhs)
    {
        ValueBase::operator=(static_cast<const ValueBase &>(rhs));
        return *this;
    }
    template <class T>
    Value &operator=(const T &rhs)
    {
        return *this = Value(rhs);
    }

    template <class T>
    T &get() { return boost::get<T>(*this); }
    template <class T>
    const T &get() const { return boost::get<const T>(*this); }

    bool isBlank() const { return which() == 0; }

    /// Insert or replace a member of an Object; a null Value becomes an
    /// empty Object first
    Value &operator[](const std::string &key);
};

/// Escape and surround with double quotes
std::string quote(const std::string &string);

/// Compact serialization, members of Objects in key order
std::ostream &operator<<(std::ostream &os, const Value &json);

}}

#endif
