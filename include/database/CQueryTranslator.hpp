/*-------------------------------------------------------------------------
 *
 * CQueryTranslator.hpp
 *      Query translation module for DocBucket.
 *      Translates document filters, sorts and index keys into SQL over
 *      a jsonb column.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "ICollection.hpp"

#include <bson/bson.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace DocBucket
{

/**
 * Concrete query translator implementation.
 *
 * Documents are stored as relaxed extended JSON in a jsonb column, so a
 * filter value is compared after the same conversion.  Values travel as
 * positional parameters ($1, $2, ...); field paths are emitted as quoted
 * text[] literals so the generated expressions match expression indexes.
 *
 * One translator builds one statement: parameters accumulate across
 * translateFilter() calls.
 */
class CQueryTranslator
{
  public:
	explicit CQueryTranslator(const std::string& documentColumn = "doc",
							  size_t firstParameter = 1);

	/* Boolean SQL expression; "TRUE" for an empty filter */
	CollectionResult<std::string> translateFilter(const CBsonDocument& filter);

	/* ORDER BY body, empty for an empty sort */
	CollectionResult<std::string> translateSort(const CBsonDocument& sort);

	/* Column list for CREATE INDEX: "(doc #> '{"files_id"}'), ..." */
	CollectionResult<std::string> translateIndex(const CBsonDocument& keys);

	const std::vector<std::string>& parameters() const;

	/* '{"a","b"}' for "a.b" */
	static std::string pathLiteral(const std::string& dottedPath);

	/* jsonb text of a single BSON value in relaxed extended JSON */
	static CollectionResult<std::string> valueToJsonb(const bson_iter_t* value);

  private:
	std::string column_;
	size_t nextParameter_;
	std::vector<std::string> parameters_;

	CollectionResult<std::string> translateClauses(const bson_iter_t* clauses,
												   const std::string& joiner);
	CollectionResult<std::string> translateField(const std::string& path,
												 const bson_iter_t* condition);
	CollectionResult<std::string>
	translateComparisonOperator(const std::string& path, const std::string& op,
								const bson_iter_t* operand);
	CollectionResult<std::string>
	translateArrayOperator(const std::string& path, const std::string& op,
						   const bson_iter_t* operand);
	CollectionResult<std::string> translateEquality(const std::string& path,
													const bson_iter_t* operand);

	std::string fieldExpression(const std::string& path) const;
	CollectionResult<std::string> bindValue(const bson_iter_t* value);

	static std::string join(const std::vector<std::string>& elements,
							const std::string& delimiter);

	/* Operator mapping table */
	static const std::unordered_map<std::string, std::string>
		comparisonOperators_;
};

} /* namespace DocBucket */
