/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#ifndef MDAST_ERRORS_H_INCLUDED
#define MDAST_ERRORS_H_INCLUDED

#include <stdexcept>
#include <string>

namespace mdast {

// Base of everything the library throws. The Markdown reader itself never
// throws; writers, the native reader and format dispatch do.
class Error: public std::runtime_error {
public:
    explicit Error(const std::string& what): std::runtime_error(what) { }
};

// A writer was handed a tree node its output format has no rendering for.
class UnsupportedConstruct: public Error {
public:
    UnsupportedConstruct(const std::string& format, const std::string& construct)
        : Error(format+" writer does not support "+construct),
          mFormat(format), mConstruct(construct) { }

    const std::string& format() const { return mFormat; }
    const std::string& construct() const { return mConstruct; }

private:
    std::string mFormat, mConstruct;
};

class ReadError: public Error {
public:
    ReadError(const std::string& message, size_t offset)
        : Error(message+" at offset "+std::to_string(offset)), mOffset(offset) { }

    size_t offset() const { return mOffset; }

private:
    size_t mOffset;
};

class UnknownFormat: public Error {
public:
    explicit UnknownFormat(const std::string& name)
        : Error("unknown format: "+name), mName(name) { }

    const std::string& name() const { return mName; }

private:
    std::string mName;
};

} // namespace mdast

#endif
