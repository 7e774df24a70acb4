/*-------------------------------------------------------------------------
 *
 * CWalkTool.hpp
 *      Commands of the bsonwalk command line tool.
 *      Part of the BsonWalk BSON document traversal library.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CWalkConfig.hpp"
#include "document/CDocument.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <system_error>
#include <vector>

namespace BsonWalk
{

/**
 * Each command works on a file holding a concatenation of BSON documents
 * and returns the process exit status. Results go to out, diagnostics to
 * err.
 */
class CWalkTool
{
  public:
    CWalkTool(const CWalkConfig& config, std::ostream& out, std::ostream& err);

    int dump(const std::string& path);
    int keys(const std::string& path);
    int get(const std::string& path, const std::string& key);
    int slice(const std::string& path, const std::string& start,
              const std::string& end, const std::string& outPath);
    int set(const std::string& path, const std::string& key,
            const std::string& value);

    static std::error_code readDocuments(const std::string& path,
                                         std::vector<CDocument>& documents);
    static std::error_code writeDocuments(const std::string& path,
                                          const std::vector<CDocument>& documents);

  private:
    bool load(const std::string& path, std::vector<CDocument>& documents);
    bool store(const std::string& path, const std::vector<CDocument>& documents);

    CWalkConfig config_;
    std::ostream& out_;
    std::ostream& err_;
};

} /* namespace BsonWalk */
