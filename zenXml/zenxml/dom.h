// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef DOM_H_82085720723894567204564256
#define DOM_H_82085720723894567204564256

#include <algorithm>
#include <list>
#include <string>
#include <vector>
#include "cvrt_text.h" //"readText/writeText"


namespace zen
{
class XmlElement;

//structured conversion: see cvrt_struc.h
template <class T> bool readStruc(const XmlElement& input, T& value);
template <class T> void writeStruc(const T& value, XmlElement& output);


class XmlElement
{
public:
    explicit XmlElement(std::string name, XmlElement* parent = nullptr) : name_(std::move(name)), parent_(parent) {}

    const std::string& getName() const { return name_; }

    //raw element text (UTF-8); ignored when serializing an element with children
    const std::string& getText() const { return value_; }
    void setText(std::string value) { value_ = std::move(value); }

    //T: string-like types, built-in arithmetic numbers, std::vector<>, user types with readStruc/writeStruc specialization
    //returns "true" if Xml element was successfully converted to value
    template <class T>
    bool getValue(T& value) const { return readStruc(*this, value); }

    template <class T>
    void setValue(const T& value) { writeStruc(value, *this); }

    //T: string-convertible type, see cvrt_text.h
    template <class T>
    bool getAttribute(const std::string& name, T& value) const
    {
        const auto it = findAttribute(name);
        return it != attributes_.end() && readText(it->value, value);
    }

    bool hasAttribute(const std::string& name) const { return findAttribute(name) != attributes_.end(); }

    template <class T>
    void setAttribute(const std::string& name, const T& value)
    {
        std::string attrValue;
        writeText(value, attrValue);

        for (Attribute& attr : attributes_)
            if (attr.name == name)
            {
                attr.value = std::move(attrValue);
                return;
            }
        attributes_.push_back({name, std::move(attrValue)});
    }

    XmlElement& addChild(std::string name)
    {
        childElements_.emplace_back(std::move(name), this);
        return childElements_.back(); //std::list: no reference invalidation
    }

    //first child with the given name, nullptr if none was found
    const XmlElement* getChild(const std::string& name) const
    {
        const auto it = std::find_if(childElements_.begin(), childElements_.end(), [&](const XmlElement& child) { return child.name_ == name; });
        return it == childElements_.end() ? nullptr : &*it;
    }

    XmlElement* getChild(const std::string& name)
    {
        return const_cast<XmlElement*>(static_cast<const XmlElement*>(this)->getChild(name));
    }

    const std::list<XmlElement>& children() const { return childElements_; }
    /**/  std::list<XmlElement>& children()       { return childElements_; }

    XmlElement*       parent()       { return parent_; } //nullptr for root element
    const XmlElement* parent() const { return parent_; }

    struct Attribute
    {
        std::string name;
        std::string value;
    };
    const std::vector<Attribute>& attributes() const { return attributes_; } //in order of creation

    //swap two elements while keeping references to parent
    void swapSubtree(XmlElement& other) noexcept
    {
        name_         .swap(other.name_);
        value_        .swap(other.value_);
        attributes_   .swap(other.attributes_);
        childElements_.swap(other.childElements_);

        for (XmlElement& child : childElements_)
            child.parent_ = this;
        for (XmlElement& child : other.childElements_)
            child.parent_ = &other;
    }

private:
    XmlElement           (const XmlElement&) = delete;
    XmlElement& operator=(const XmlElement&) = delete;

    std::vector<Attribute>::const_iterator findAttribute(const std::string& name) const
    {
        return std::find_if(attributes_.begin(), attributes_.end(), [&](const Attribute& attr) { return attr.name == name; });
    }

    std::string name_;
    std::string value_;
    std::vector<Attribute> attributes_;
    std::list<XmlElement> childElements_; //in order of creation
    XmlElement* parent_ = nullptr;
};


//the complete XML document
class XmlDoc
{
public:
    XmlDoc() {}
    explicit XmlDoc(std::string rootName) : root_(std::move(rootName)) {}

    XmlDoc(XmlDoc&& tmp) noexcept { swap(tmp); }
    XmlDoc& operator=(XmlDoc&& tmp) noexcept { swap(tmp); return *this; }

    const XmlElement& root() const { return root_; }
    /**/  XmlElement& root()       { return root_; }

    //XML declaration: <?xml version="1.0" encoding="utf-8"?>
    const std::string& getVersion () const { return version_; }
    const std::string& getEncoding() const { return encoding_; }
    void setVersion (const std::string& version ) { version_  = version; }
    void setEncoding(const std::string& encoding) { encoding_ = encoding; }

    void swap(XmlDoc& other) noexcept
    {
        version_ .swap(other.version_);
        encoding_.swap(other.encoding_);
        root_.swapSubtree(other.root_);
    }

private:
    XmlDoc           (const XmlDoc&) = delete; //thanks to XmlElement::parent_
    XmlDoc& operator=(const XmlDoc&) = delete;

    std::string version_ {"1.0"}; //non-optional for valid XML
    std::string encoding_{"utf-8"};

    XmlElement root_{"Root"};
};
}

#endif //DOM_H_82085720723894567204564256
