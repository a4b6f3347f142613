// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef XML_H_349578228034572457454554
#define XML_H_349578228034572457454554

#include <unordered_set>
#include <zen/file_io.h>
#include <zen/format_unit.h>
#include <zen/stl_tools.h>
#include "cvrt_struc.h"
#include "parser.h"


namespace zen
{
//load and parse XML file; quick-exit if input file is not an XML
XmlDoc loadXml(const Zstring& filePath); //throw FileError

//serialize XML and save to file; file is only updated if content changed
void saveXml(const XmlDoc& doc, const Zstring& filePath); //throw FileError


//proxy class to conveniently convert user data into XML structure
/*
    XmlDoc doc("Config");
    XmlOut out(doc);
    out["Count"](3);
    out["Path"].attribute("Enabled", true);
    saveXml(doc, filePath); //throw FileError

    <?xml version="1.0" encoding="utf-8"?>
    <Config>
        <Count>3</Count>
        <Path Enabled="true"/>
    </Config>                                                  */
class XmlOut
{
public:
    explicit XmlOut(XmlDoc& doc) : ref_(doc.root()) {}

    //child element is created if not yet existing
    XmlOut operator[](std::string name) const
    {
        XmlElement* child = ref_.getChild(name);
        return XmlOut(child ? *child : ref_.addChild(std::move(name)));
    }

    //always add a new child element: allow multiple elements with the same name
    XmlOut addChild(std::string name) const { return XmlOut(ref_.addChild(std::move(name))); }

    template <class T>
    void operator()(const T& value) { writeStruc(value, ref_); }

    template <class T>
    void attribute(const std::string& name, const T& value) { ref_.setAttribute(name, value); }

private:
    explicit XmlOut(XmlElement& element) : ref_(element) {}

    XmlElement& ref_;
};


//proxy class to conveniently convert XML structure to user data
/*
    XmlIn in(doc);
    in["Count"](count);
    in["Path"].attribute("Enabled", enabled);

    if (!in.getErrors().empty()) -> list of element and attribute names which failed to convert       */
class XmlIn
{
    struct ErrorLog;

public:
    explicit XmlIn(const XmlDoc& doc) : XmlIn(&doc.root(), '<' + doc.root().getName() + '>', makeSharedRef<ErrorLog>()) {}

    //it is not an error if the child element does not exist, but only later if a conversion to user data is attempted
    XmlIn operator[](const std::string& name) const
    {
        return XmlIn(elem_ ? elem_->getChild(name) : nullptr, elementNameFmt_ + " <" + name + '>', log_);
    }

    template <class Function>
    void visitChildren(Function fun) const
    {
        if (!elem_)
            logElementError(elementNameFmt_); //missing element
        else if (!elem_->getText().empty())
            logElementError(elementNameFmt_); //have XML value element, not container!
        else
        {
            size_t childIdx = 0;
            for (const XmlElement& child : elem_->children())
                fun(XmlIn(&child, elementNameFmt_ + " <" + child.getName() + ">[" + numberTo<std::string>(++childIdx) + ']', log_));
        }
    }

    explicit operator bool() const { return elem_; }

    //returns "true" if data was read successfully
    template <class T>
    bool operator()(T& value) const
    {
        if (elem_ && readStruc(*elem_, value))
            return true;

        logElementError(elementNameFmt_); //missing element or conversion error
        return false;
    }

    bool hasAttribute(const std::string& name) const { return elem_ && elem_->hasAttribute(name); }

    template <class T>
    bool attribute(const std::string& name, T& value) const
    {
        if (elem_ && elem_->getAttribute(name, value))
            return true;

        logElementError(elementNameFmt_ + " @" + name);
        return false;
    }

    //error logging is shared by all XmlIn proxies created from each other
    //=> unrelated XmlIn proxies can be used in different threads
    const std::wstring& getErrors() const { return log_.ref().failedElements; }

    const std::string* getName() const { return elem_ ? &elem_->getName() : nullptr; }

private:
    XmlIn(const XmlElement* elem,
          const std::string& elementNameFmt,
          const SharedRef<ErrorLog>& sharedlog) : log_(sharedlog), elem_(elem), elementNameFmt_(elementNameFmt) {}

    struct ErrorLog
    {
        std::wstring failedElements; //unique list of failed elements
        std::unordered_set<std::string> usedElements;
    };

    void logElementError(const std::string& elementName) const
    {
        if (const auto [it, inserted] = log_.ref().usedElements.insert(elementName);
            inserted)
        {
            if (!log_.ref().failedElements.empty())
                log_.ref().failedElements += L'\n';
            log_.ref().failedElements += utfTo<std::wstring>(elementName);
        }
    }

    mutable SharedRef<ErrorLog> log_;
    const XmlElement* elem_;
    std::string elementNameFmt_; //e.g. "<Root> <Child> <List>[1]"
};








//######################## implementation ########################
inline
XmlDoc loadXml(const Zstring& filePath) //throw FileError
{
    const std::string stream = getFileContent(filePath); //throw FileError

    std::string_view header = stream;
    if (startsWith(header, BYTE_ORDER_MARK_UTF8))
        header.remove_prefix(BYTE_ORDER_MARK_UTF8.size());

    if (!startsWith(header, "<?xml ") &&
        !startsWith(header, "<?xml?>"))
        throw FileError(replaceCpy(_("File %x does not contain a valid configuration."), L"%x", fmtPath(filePath)));

    try
    {
        return parseXml(stream); //throw XmlParsingError
    }
    catch (const XmlParsingError& e)
    {
        throw FileError(
            replaceCpy(replaceCpy(replaceCpy(_("Error parsing file %x, row %y, column %z."),
                                             L"%x", fmtPath(filePath)),
                                  L"%y", formatNumber(e.row + 1)),
                       L"%z", formatNumber(e.col + 1)));
    }
}


inline
void saveXml(const XmlDoc& doc, const Zstring& filePath) //throw FileError
{
    const std::string stream = serializeXml(doc); //noexcept

    //only update XML file if there are changes
    if (const std::optional<ItemType> type = getItemTypeIfExists(filePath); //throw FileError
        type && *type == ItemType::file)
        if (getFileSize(filePath) == stream.size()) //throw FileError
            if (getFileContent(filePath) == stream) //throw FileError
                return;

    setFileContent(filePath, stream); //throw FileError
}
}

#endif //XML_H_349578228034572457454554
