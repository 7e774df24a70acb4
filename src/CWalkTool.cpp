/*-------------------------------------------------------------------------
 *
 * CWalkTool.cpp
 *		  Commands of the bsonwalk command line tool
 *
 * Reads files holding back-to-back BSON documents and runs the document
 * iterator, subsequence extractor and in-place overwriter over each one.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/CWalkTool.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CWalkTool.hpp"

#include "CLogMacros.hpp"
#include "document/CBsonError.hpp"
#include "document/CByteOrder.hpp"
#include "document/CDocumentBuilder.hpp"
#include "document/CDocumentIterator.hpp"
#include "document/CSubsequenceExtractor.hpp"
#include "document/CTypeRegistry.hpp"

#include <charconv>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>

namespace BsonWalk
{

namespace
{

template <typename T>
std::optional<T>
parseNumber(const std::string& text)
{
	T			value{};
	const char *first = text.data();
	const char *last = text.data() + text.size();

	auto result = std::from_chars(first, last, value);
	if (result.ec != std::errc() || result.ptr != last)
		return std::nullopt;
	return value;
}

/*
 * parseValueFor
 *		Interpret command line text as a value of the given wire type
 */
std::optional<CBsonValue>
parseValueFor(CBsonWireType type, const std::string& text)
{
	switch (type)
	{
		case CBsonWireType::Int32:
			if (auto v = parseNumber<int32_t>(text))
				return CBsonValue(*v);
			break;
		case CBsonWireType::Int64:
			if (auto v = parseNumber<int64_t>(text))
				return CBsonValue(*v);
			break;
		case CBsonWireType::DateTime:
			if (auto v = parseNumber<int64_t>(text))
				return CBsonValue(CBsonDateTime{*v});
			break;
		case CBsonWireType::Double:
			if (auto v = parseNumber<double>(text))
				return CBsonValue(*v);
			break;
		case CBsonWireType::Boolean:
			if (text == "true" || text == "1")
				return CBsonValue(true);
			if (text == "false" || text == "0")
				return CBsonValue(false);
			break;
		default:
			break;
	}
	return std::nullopt;
}

} /* anonymous namespace */

CWalkTool::CWalkTool(const CWalkConfig& config, std::ostream& out,
					 std::ostream& err)
	: config_(config), out_(out), err_(err)
{
}

/*
 * readDocuments
 *		Split a file into its length-prefixed documents
 */
std::error_code
CWalkTool::readDocuments(const std::string& path,
						 std::vector<CDocument>& documents)
{
	std::ifstream file(path, std::ios::binary);
	if (!file)
		return std::make_error_code(std::errc::no_such_file_or_directory);

	std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
							   std::istreambuf_iterator<char>());
	if (file.bad())
		return std::make_error_code(std::errc::io_error);

	documents.clear();
	size_t pos = 0;
	while (pos < bytes.size())
	{
		if (bytes.size() - pos < 4)
			return make_error_code(CBsonErrc::MalformedHeader);

		int32_t len = readInt32LE(bytes.data() + pos);
		if (len < 5 || static_cast<size_t>(len) > bytes.size() - pos)
			return make_error_code(CBsonErrc::MalformedHeader);

		documents.emplace_back(bytes.data() + pos, static_cast<size_t>(len));
		pos += static_cast<size_t>(len);
	}

	debug_log("read " + std::to_string(documents.size()) +
			  " documents from " + path);
	return std::error_code();
}

std::error_code
CWalkTool::writeDocuments(const std::string& path,
						  const std::vector<CDocument>& documents)
{
	std::ofstream file(path, std::ios::binary | std::ios::trunc);
	if (!file)
		return std::make_error_code(std::errc::permission_denied);

	for (const auto& doc : documents)
		file.write(reinterpret_cast<const char*>(doc.data()),
				   static_cast<std::streamsize>(doc.size()));

	file.flush();
	if (!file)
		return std::make_error_code(std::errc::io_error);
	return std::error_code();
}

bool
CWalkTool::load(const std::string& path, std::vector<CDocument>& documents)
{
	std::error_code ec = readDocuments(path, documents);
	if (ec)
	{
		err_ << "Failed to read " << path << ": " << ec.message() << std::endl;
		error_log("failed to read " + path + ": " + ec.message());
		return false;
	}
	return true;
}

bool
CWalkTool::store(const std::string& path,
				 const std::vector<CDocument>& documents)
{
	std::error_code ec = writeDocuments(path, documents);
	if (ec)
	{
		err_ << "Failed to write " << path << ": " << ec.message()
			 << std::endl;
		error_log("failed to write " + path + ": " + ec.message());
		return false;
	}
	return true;
}

/*
 * dump
 *		Print each document as extended JSON
 */
int
CWalkTool::dump(const std::string& path)
{
	std::vector<CDocument> documents;
	int			rc = 0;

	if (!load(path, documents))
		return 1;

	for (size_t i = 0; i < documents.size(); i++)
	{
		std::string json = documents[i].toJson(config_.relaxedJson());
		if (json.empty())
		{
			err_ << "document " << i << " is not valid BSON" << std::endl;
			rc = 1;
			continue;
		}
		out_ << json << "\n";
	}
	return rc;
}

/*
 * keys
 *		Print the top level keys of each document, one line per document
 */
int
CWalkTool::keys(const std::string& path)
{
	std::vector<CDocument> documents;
	int			rc = 0;

	if (!load(path, documents))
		return 1;

	for (size_t i = 0; i < documents.size(); i++)
	{
		CDocumentIterator iter(documents[i], config_.policy());
		if (!iter.isValid())
		{
			err_ << "document " << i << ": " << iter.lastError().message()
				 << std::endl;
			rc = 1;
			continue;
		}

		std::vector<std::string> names = iter.keys();
		for (size_t k = 0; k < names.size(); k++)
			out_ << (k ? " " : "") << names[k];
		out_ << "\n";

		if (iter.lastError())
		{
			err_ << "document " << i << ": traversal stopped: "
				 << iter.lastError().message() << std::endl;
			rc = 1;
		}
	}
	return rc;
}

/*
 * get
 *		Print the first value named key in each document
 */
int
CWalkTool::get(const std::string& path, const std::string& key)
{
	std::vector<CDocument> documents;
	size_t		found = 0;
	int			rc = 0;

	if (!load(path, documents))
		return 1;

	for (size_t i = 0; i < documents.size(); i++)
	{
		CDocumentIterator iter(documents[i], key, config_.policy());
		if (!iter.isValid())
		{
			if (iter.lastError() != CBsonErrc::KeyNotFound)
			{
				err_ << "document " << i << ": "
					 << iter.lastError().message() << std::endl;
				rc = 1;
			}
			continue;
		}

		CBsonValue value;
		std::error_code ec = iter.safeCurrentValue(value);
		if (ec || value.isInvalid())
		{
			err_ << "document " << i << ": value of '" << key
				 << "' cannot be decoded" << std::endl;
			rc = 1;
			continue;
		}

		CDocumentBuilder builder;
		if (!builder.append(key, value))
		{
			err_ << "document " << i << ": " << builder.getLastError()
				 << std::endl;
			rc = 1;
			continue;
		}
		out_ << builder.build().toJson(config_.relaxedJson()) << "\n";
		found++;
	}

	if (found == 0)
	{
		err_ << "key '" << key << "' not found" << std::endl;
		return 1;
	}
	return rc;
}

/*
 * slice
 *		Write elements [start, end) of every document to outPath
 */
int
CWalkTool::slice(const std::string& path, const std::string& start,
				 const std::string& end, const std::string& outPath)
{
	std::vector<CDocument> documents;
	std::vector<CDocument> slices;

	auto first = parseNumber<size_t>(start);
	std::optional<size_t> last = (end == "end")
		? std::optional<size_t>(std::numeric_limits<size_t>::max())
		: parseNumber<size_t>(end);
	if (!first || !last)
	{
		err_ << "Invalid range: " << start << " " << end << std::endl;
		return 1;
	}
	if (*last < *first)
	{
		err_ << "Invalid range: end " << *last << " precedes start " << *first
			 << std::endl;
		return 1;
	}

	if (!load(path, documents))
		return 1;

	for (const auto& doc : documents)
		slices.push_back(CSubsequenceExtractor::subsequence(
			doc, *first, *last, config_.policy()));

	if (!store(outPath, slices))
		return 1;

	info_log("wrote " + std::to_string(slices.size()) + " slices to " +
			 outPath);
	out_ << "wrote " << slices.size() << " documents to " << outPath << "\n";
	return 0;
}

/*
 * set
 *		Overwrite the first fixed width value named key in every document
 *		and rewrite the file; the file length never changes
 */
int
CWalkTool::set(const std::string& path, const std::string& key,
			   const std::string& value)
{
	const CTypeRegistry &registry = CTypeRegistry::instance();
	std::vector<CDocument> documents;
	size_t		updated = 0;
	int			rc = 0;

	if (!load(path, documents))
		return 1;

	for (size_t i = 0; i < documents.size(); i++)
	{
		auto iter = CDocumentIterator::forWriting(documents[i],
												  config_.policy());
		if (!iter.isValid())
		{
			err_ << "document " << i << ": " << iter.lastError().message()
				 << std::endl;
			rc = 1;
			continue;
		}
		if (!iter.move(key))
			continue;

		CBsonWireType type = iter.currentType();
		auto newValue = parseValueFor(type, value);
		if (!newValue)
		{
			err_ << "document " << i << ": cannot set " << registry.typeName(type)
				 << " value from '" << value << "'" << std::endl;
			rc = 1;
			continue;
		}

		std::error_code ec = iter.overwriteCurrentValue(*newValue);
		if (ec)
		{
			err_ << "document " << i << ": " << ec.message() << std::endl;
			rc = 1;
			continue;
		}
		updated++;
	}

	if (updated > 0 && !store(path, documents))
		return 1;

	info_log("updated " + std::to_string(updated) + " of " +
			 std::to_string(documents.size()) + " documents in " + path);
	out_ << "updated " << updated << " of " << documents.size()
		 << " documents\n";
	return rc;
}

} /* namespace BsonWalk */
