//----------------------------------------------------------------------------------------------------------------------
// File: PrettyPrinter.hpp
// Description: Renders a JSON document with indentation so operator edited files stay readable.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <sstream>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace JSON {
//----------------------------------------------------------------------------------------------------------------------

class PrettyPrinter;

//----------------------------------------------------------------------------------------------------------------------
} // JSON namespace
//----------------------------------------------------------------------------------------------------------------------

class JSON::PrettyPrinter
{
public:
    static constexpr std::string_view ValueSeparator = ": ";
    static constexpr std::string_view FieldSeparator = ",\n";
    static constexpr std::string_view Newline = "\n";

    static constexpr std::size_t DefaultTabSize = 4;

    explicit PrettyPrinter(std::size_t tabSize = DefaultTabSize);

    [[nodiscard]] std::string Format(boost::json::value const& json);

private:
    void Write(boost::json::value const& json, std::ostream& os);
    void IncreaseIndent();
    void DecreaseIndent();

    std::string m_indentation;
    std::size_t m_tabSize;
};

//----------------------------------------------------------------------------------------------------------------------

inline JSON::PrettyPrinter::PrettyPrinter(std::size_t tabSize)
    : m_indentation()
    , m_tabSize(tabSize)
{
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string JSON::PrettyPrinter::Format(boost::json::value const& json)
{
    m_indentation.clear();
    std::ostringstream os;
    Write(json, os);
    os << Newline;
    return os.str();
}

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::Write(boost::json::value const& json, std::ostream& os)
{
    switch (json.kind()) {
        case boost::json::kind::object: {
            auto const& object = json.get_object();
            if (object.empty()) { os << "{}"; break; }

            os << "{" << Newline;
            IncreaseIndent();
            for (auto itr = object.begin();;) {
                os << m_indentation << boost::json::serialize(itr->key()) << ValueSeparator;
                Write(itr->value(), os);
                if (++itr == object.end()) { break; }
                os << FieldSeparator;
            }
            os << Newline;
            DecreaseIndent();
            os << m_indentation << "}";
        } break;
        case boost::json::kind::array: {
            auto const& array = json.get_array();
            if (array.empty()) { os << "[]"; break; }

            os << "[" << Newline;
            IncreaseIndent();
            for (auto itr = array.begin();;) {
                os << m_indentation;
                Write(*itr, os);
                if (++itr == array.end()) { break; }
                os << FieldSeparator;
            }
            os << Newline;
            DecreaseIndent();
            os << m_indentation << "]";
        } break;
        // Scalars share the compact serializer so escaping and number formatting stay canonical.
        default: os << boost::json::serialize(json); break;
    }
}

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::IncreaseIndent() { m_indentation.append(m_tabSize, ' '); }

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::DecreaseIndent() { m_indentation.resize(m_indentation.size() - m_tabSize); }

//----------------------------------------------------------------------------------------------------------------------
