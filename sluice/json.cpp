// Copyright (c) 2026 - Sluice contributors

#include "json.h"

#include <stdio.h>

#include <ostream>

namespace Sluice {
namespace JSON {

Value &
Value::operator[](const std::string &key)
{
    if (isBlank())
        *this = Object();
    return get<Object>()[key];
}

std::string
quote(const std::string &string)
{
    std::string result(1, '"');
    for (size_t i = 0; i < string.size(); ++i) {
        unsigned char c = (unsigned char)string[i];
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (c < 0x20) {
                    char escaped[7];
                    snprintf(escaped, sizeof(escaped), "\\u%04x", c);
                    result += escaped;
                } else {
                    result += (char)c;
                }
        }
    }
    return result += '"';
}

namespace {
class Writer : public boost::static_visitor<>
{
public:
    Writer(std::ostream &os) : m_os(os) {}

    void operator()(const boost::blank &) const { m_os << "null"; }
    void operator()(bool value) const { m_os << (value ? "true" : "false"); }
    void operator()(long long value) const { m_os << value; }
    void operator()(double value) const { m_os << value; }
    void operator()(const std::string &value) const { m_os << quote(value); }

    void operator()(const Array &array) const
    {
        m_os << '[';
        for (size_t i = 0; i < array.size(); ++i) {
            if (i != 0)
                m_os << ", ";
            m_os << array[i];
        }
        m_os << ']';
    }

    void operator()(const Object &object) const
    {
        m_os << '{';
        for (Object::const_iterator it = object.begin(); it != object.end();
            ++it) {
            if (it != object.begin())
                m_os << ", ";
            m_os << quote(it->first) << ": " << it->second;
        }
        m_os << '}';
    }

private:
    std::ostream &m_os;
};
}

std::ostream &
operator<<(std::ostream &os, const Value &json)
{
    boost::apply_visitor(Writer(os), static_cast<const ValueBase &>(json));
    return os;
}

}}
