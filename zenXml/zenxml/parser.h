// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef PARSER_H_81248670213764583021432
#define PARSER_H_81248670213764583021432

#include <cstddef>
#include <zen/string_tools.h>
#include "dom.h"


namespace zen
{
//convert XML document to byte stream (UTF-8)
std::string serializeXml(const XmlDoc& doc,
                         const std::string& lineBreak = "\n",
                         const std::string& indent    = "    "); //noexcept


struct XmlParsingError
{
    XmlParsingError(size_t rowNo, size_t colNo) : row(rowNo), col(colNo) {}
    const size_t row; //zero-based
    const size_t col; //
};

//supported subset: XML declaration, elements, attributes, text, comments, predefined and numeric character references
XmlDoc parseXml(const std::string& stream); //throw XmlParsingError








//---------------------------- implementation ----------------------------
//see: https://www.w3.org/TR/xml/

namespace xml_impl
{
template <class Predicate> inline
std::string escape(std::string_view str, Predicate encodeAsRef) //encodeAsRef: char => true if char shall be written as character reference
{
    std::string output;
    for (const char c : str)
        switch (c)
        {
            //*INDENT-OFF*
            case '&': output += "&amp;"; break; //
            case '<': output +=  "&lt;"; break; //mandatory: https://www.w3.org/TR/xml/#syntax
            case '>': output +=  "&gt;"; break; //
            case '"':
                if (encodeAsRef(c)) output += "&quot;";
                else                output += c;
                break;
            default:
                if (encodeAsRef(c))
                {
                    const auto [high, low] = hexify(static_cast<unsigned char>(c));
                    output += "&#x";
                    output += high;
                    output += low;
                    output += ';';
                }
                else
                    output += c;
                break;
            //*INDENT-ON*
        }
    return output;
}

inline std::string escapeText     (std::string_view str) { return escape(str, [](char c) { return static_cast<unsigned char>(c) < 32 && c != '\n' && c != '\t'; }); }
inline std::string escapeAttribute(std::string_view str) { return escape(str, [](char c) { return static_cast<unsigned char>(c) < 32 || c == '"'; }); }


inline
void serializeElement(const XmlElement& element, std::string& stream, const std::string& lineBreak, const std::string& indent, size_t indentLevel)
{
    std::string indentFmt;
    for (size_t i = 0; i < indentLevel; ++i)
        indentFmt += indent;

    stream += indentFmt + '<' + element.getName();

    for (const XmlElement::Attribute& attr : element.attributes())
        stream += ' ' + attr.name + "=\"" + escapeAttribute(attr.value) + '"';

    if (!element.children().empty()) //structured element: no support for mixed content
    {
        stream += '>' + lineBreak;
        for (const XmlElement& child : element.children())
            serializeElement(child, stream, lineBreak, indent, indentLevel + 1);
        stream += indentFmt + "</" + element.getName() + '>' + lineBreak;
    }
    else if (!element.getText().empty()) //value element
        stream += '>' + escapeText(element.getText()) + "</" + element.getName() + '>' + lineBreak;
    else //empty element
        stream += "/>" + lineBreak;
}


class Parser
{
public:
    explicit Parser(const std::string& stream) : stream_(stream)
    {
        if (startsWith(stream_, BYTE_ORDER_MARK_UTF8))
            pos_ = BYTE_ORDER_MARK_UTF8.size();
    }

    XmlDoc parseDocument() //throw XmlParsingError
    {
        XmlDoc doc;
        skipMisc();

        if (tryConsume("<?xml"))
        {
            XmlElement decl("xml");
            parseAttributes(decl); //throw XmlParsingError
            expect("?>");          //

            std::string version, encoding;
            if (decl.getAttribute("version", version))
                doc.setVersion(version);
            if (decl.getAttribute("encoding", encoding))
                doc.setEncoding(encoding);
        }
        skipMisc();

        expect("<");
        XmlElement root(parseName());
        parseElementRemainder(root); //throw XmlParsingError
        doc.root().swapSubtree(root);

        skipMisc();
        if (pos_ != stream_.size()) //trailing garbage
            throwError();
        return doc;
    }

private:
    Parser           (const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    [[noreturn]] void throwError() const
    {
        size_t row = 0;
        size_t col = 0;
        for (size_t i = 0; i < std::min(pos_, stream_.size()); ++i)
            if (stream_[i] == '\n')
            {
                ++row;
                col = 0;
            }
            else
                ++col;
        throw XmlParsingError(row, col);
    }

    bool atEnd() const { return pos_ >= stream_.size(); }

    bool lookingAt(std::string_view str) const { return std::string_view(stream_).substr(pos_).starts_with(str); }

    bool tryConsume(std::string_view str)
    {
        if (!lookingAt(str))
            return false;
        pos_ += str.size();
        return true;
    }

    void expect(std::string_view str)
    {
        if (!tryConsume(str))
            throwError();
    }

    void skipWhiteSpace()
    {
        while (!atEnd() && isWhiteSpace(stream_[pos_]))
            ++pos_;
    }

    //whitespace, comments, processing instructions, DOCTYPE
    void skipMisc()
    {
        for (;;)
        {
            skipWhiteSpace();
            if (lookingAt("<!--"))
                skipPast("-->");
            else if (lookingAt("<?") && !lookingAt("<?xml ") && !lookingAt("<?xml?"))
                skipPast("?>");
            else if (lookingAt("<!DOCTYPE"))
                skipPast(">");
            else
                return;
        }
    }

    void skipPast(std::string_view term)
    {
        const size_t posEnd = stream_.find(term, pos_);
        if (posEnd == std::string::npos)
        {
            pos_ = stream_.size();
            throwError();
        }
        pos_ = posEnd + term.size();
    }

    std::string parseName()
    {
        const size_t posBegin = pos_;
        while (!atEnd())
        {
            const char c = stream_[pos_];
            if (isWhiteSpace(c) || c == '<' || c == '>' || c == '=' || c == '/' || c == '?' || c == '"' || c == '\'')
                break;
            ++pos_;
        }
        if (pos_ == posBegin)
            throwError();
        return stream_.substr(posBegin, pos_ - posBegin);
    }

    //decode character references and normalize line endings
    std::string parseCharData(std::string_view terminators)
    {
        std::string output;
        while (!atEnd() && terminators.find(stream_[pos_]) == std::string_view::npos)
        {
            const char c = stream_[pos_];
            if (c == '&')
                output += parseReference(); //throw XmlParsingError
            else if (c == '\r') //map all end-of-line characters to \n https://www.w3.org/TR/xml/#sec-line-ends
            {
                ++pos_;
                if (!atEnd() && stream_[pos_] == '\n')
                    ++pos_;
                output += '\n';
            }
            else
            {
                output += c;
                ++pos_;
            }
        }
        return output;
    }

    std::string parseReference()
    {
        const size_t posEnd = stream_.find(';', pos_);
        if (posEnd == std::string::npos)
            throwError();

        const std::string_view ref(stream_.data() + pos_ + 1, posEnd - pos_ - 1); //without '&' and ';'
        std::string output;

        if (ref == "amp")
            output = '&';
        else if (ref == "lt")
            output = '<';
        else if (ref == "gt")
            output = '>';
        else if (ref == "apos")
            output = '\'';
        else if (ref == "quot")
            output = '"';
        else if (startsWith(ref, "#x") && ref.size() > 2 && ref.size() <= 8 && std::all_of(ref.begin() + 2, ref.end(), [](char c) { return isHexDigit(c); }))
            impl::codePointToUtf8(static_cast<impl::CodePoint>(std::stoul(std::string(ref.substr(2)), nullptr, 16)), output);
        else if (startsWith(ref, "#") && ref.size() > 1 && ref.size() <= 8 && std::all_of(ref.begin() + 1, ref.end(), [](char c) { return isDigit(c); }))
            impl::codePointToUtf8(static_cast<impl::CodePoint>(std::stoul(std::string(ref.substr(1)))), output);
        else
            throwError();

        pos_ = posEnd + 1;
        return output;
    }

    void parseAttributes(XmlElement& element)
    {
        for (;;)
        {
            skipWhiteSpace();
            if (atEnd())
                throwError();

            const char c = stream_[pos_];
            if (c == '>' || c == '/' || c == '?')
                return;

            const std::string name = parseName();
            skipWhiteSpace();
            expect("=");
            skipWhiteSpace();

            if (atEnd() || (stream_[pos_] != '"' && stream_[pos_] != '\''))
                throwError();
            const char quote = stream_[pos_++];

            std::string value = parseCharData(std::string_view(&quote, 1));
            if (atEnd())
                throwError();
            ++pos_; //closing quote

            if (element.hasAttribute(name)) //https://www.w3.org/TR/xml/#uniqattspec
                throwError();
            element.setAttribute(name, value);
        }
    }

    //start tag name already consumed
    void parseElementRemainder(XmlElement& element)
    {
        parseAttributes(element);

        if (tryConsume("/>")) //empty element
            return;
        expect(">");

        std::string text;
        for (;;)
        {
            text += parseCharData("<");
            if (atEnd())
                throwError();

            if (lookingAt("<!--"))
                skipPast("-->");
            else if (tryConsume("<![CDATA["))
            {
                const size_t posEnd = stream_.find("]]>", pos_);
                if (posEnd == std::string::npos)
                    throwError();
                text.append(stream_, pos_, posEnd - pos_);
                pos_ = posEnd + 3;
            }
            else if (tryConsume("</"))
            {
                if (parseName() != element.getName())
                    throwError();
                skipWhiteSpace();
                expect(">");
                break;
            }
            else
            {
                expect("<");
                XmlElement& child = element.addChild(parseName());
                parseElementRemainder(child); //throw XmlParsingError
            }
        }

        //no support for mixed content: whitespace between child elements is formatting
        if (element.children().empty() && !std::all_of(text.begin(), text.end(), [](char c) { return isWhiteSpace(c); }))
            element.setText(std::move(text));
    }

    const std::string& stream_;
    size_t pos_ = 0;
};
}


inline
std::string serializeXml(const XmlDoc& doc,
                         const std::string& lineBreak,
                         const std::string& indent)
{
    std::string output = "<?xml";

    if (!doc.getVersion().empty())
        output += " version=\"" + xml_impl::escapeAttribute(doc.getVersion()) + '"';

    if (!doc.getEncoding().empty())
        output += " encoding=\"" + xml_impl::escapeAttribute(doc.getEncoding()) + '"';

    output += "?>" + lineBreak;

    xml_impl::serializeElement(doc.root(), output, lineBreak, indent, 0 /*indentLevel*/);
    return output;
}


inline
XmlDoc parseXml(const std::string& stream) //throw XmlParsingError
{
    xml_impl::Parser parser(stream);
    return parser.parseDocument(); //throw XmlParsingError
}
}

#endif //PARSER_H_81248670213764583021432
