/*-------------------------------------------------------------------------
 *
 * CQueryTranslator.cpp
 *      Document filter to SQL translation over jsonb.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "database/CQueryTranslator.hpp"

#include <nlohmann/json.hpp>

namespace DocBucket
{

const std::unordered_map<std::string, std::string>
	CQueryTranslator::comparisonOperators_ = {{"$gt", ">"},
											  {"$gte", ">="},
											  {"$lt", "<"},
											  {"$lte", "<="}};

namespace
{

CCollectionError badValue(const std::string& message)
{
	return CCollectionError(COLLECTION_ERROR_BAD_VALUE, message);
}

bool isOperatorDocument(const bson_iter_t* condition)
{
	bson_iter_t child;

	if (!BSON_ITER_HOLDS_DOCUMENT(condition) ||
		!bson_iter_recurse(condition, &child) || !bson_iter_next(&child))
	{
		return false;
	}
	return bson_iter_key(&child)[0] == '$';
}

} /* anonymous namespace */

CQueryTranslator::CQueryTranslator(const std::string& documentColumn,
								   size_t firstParameter)
	: column_(documentColumn), nextParameter_(firstParameter)
{
}

const std::vector<std::string>& CQueryTranslator::parameters() const
{
	return parameters_;
}

std::string CQueryTranslator::pathLiteral(const std::string& dottedPath)
{
	std::string literal = "'{";
	size_t start = 0;

	while (true)
	{
		size_t dot = dottedPath.find('.', start);
		std::string segment = dottedPath.substr(
			start, dot == std::string::npos ? std::string::npos : dot - start);

		if (start > 0)
			literal += ',';
		literal += '"';
		for (char c : segment)
		{
			if (c == '"' || c == '\\')
				literal += '\\';
			if (c == '\'')
				literal += '\'';
			literal += c;
		}
		literal += '"';

		if (dot == std::string::npos)
			break;
		start = dot + 1;
	}

	literal += "}'";
	return literal;
}

CollectionResult<std::string>
CQueryTranslator::valueToJsonb(const bson_iter_t* value)
{
	CBsonDocument holder;

	if (!holder.appendIterValue("v", value))
		return std::unexpected(badValue(holder.getLastError()));

	std::string json = holder.toRelaxedJson();
	nlohmann::json parsed = nlohmann::json::parse(json, nullptr, false);
	if (parsed.is_discarded() || !parsed.contains("v"))
		return std::unexpected(badValue("value has no JSON representation"));

	return parsed["v"].dump();
}

std::string CQueryTranslator::fieldExpression(const std::string& path) const
{
	return "(" + column_ + " #> " + pathLiteral(path) + ")";
}

CollectionResult<std::string> CQueryTranslator::bindValue(const bson_iter_t* value)
{
	auto jsonb = valueToJsonb(value);
	if (!jsonb)
		return std::unexpected(jsonb.error());

	parameters_.push_back(*jsonb);
	return "$" + std::to_string(nextParameter_++) + "::jsonb";
}

CollectionResult<std::string>
CQueryTranslator::translateFilter(const CBsonDocument& filter)
{
	bson_iter_t iter;

	if (filter.isEmpty())
		return std::string("TRUE");
	if (!bson_iter_init(&iter, filter.get()))
		return std::unexpected(badValue("filter is not a valid document"));

	std::vector<std::string> clauses;
	while (bson_iter_next(&iter))
	{
		std::string key = bson_iter_key(&iter);
		CollectionResult<std::string> clause;

		if (key == "$and" || key == "$or")
		{
			if (!BSON_ITER_HOLDS_ARRAY(&iter))
				return std::unexpected(badValue(key + " must be an array"));
			clause = translateClauses(&iter, key == "$and" ? " AND " : " OR ");
		}
		else if (key[0] == '$')
		{
			return std::unexpected(badValue("unknown top level operator: " + key));
		}
		else
		{
			clause = translateField(key, &iter);
		}

		if (!clause)
			return std::unexpected(clause.error());
		clauses.push_back(*clause);
	}

	if (clauses.size() == 1)
		return clauses.front();
	return "(" + join(clauses, " AND ") + ")";
}

CollectionResult<std::string>
CQueryTranslator::translateClauses(const bson_iter_t* clauses,
								   const std::string& joiner)
{
	bson_iter_t child;
	std::vector<std::string> parts;

	if (!bson_iter_recurse(clauses, &child))
		return std::unexpected(badValue("malformed clause array"));

	while (bson_iter_next(&child))
	{
		if (!BSON_ITER_HOLDS_DOCUMENT(&child))
			return std::unexpected(badValue("clause must be a document"));

		uint32_t length = 0;
		const uint8_t* data = nullptr;
		bson_iter_document(&child, &length, &data);
		auto subfilter = CBsonDocument::fromData(data, length);
		if (!subfilter)
			return std::unexpected(badValue("malformed clause document"));

		auto part = translateFilter(*subfilter);
		if (!part)
			return std::unexpected(part.error());
		parts.push_back(*part);
	}

	if (parts.empty())
		return std::unexpected(badValue("clause array must not be empty"));
	return "(" + join(parts, joiner) + ")";
}

CollectionResult<std::string>
CQueryTranslator::translateField(const std::string& path,
								 const bson_iter_t* condition)
{
	if (!isOperatorDocument(condition))
		return translateEquality(path, condition);

	bson_iter_t op;
	std::vector<std::string> parts;

	bson_iter_recurse(condition, &op);
	while (bson_iter_next(&op))
	{
		std::string name = bson_iter_key(&op);
		CollectionResult<std::string> part;

		if (name == "$eq")
		{
			part = translateEquality(path, &op);
		}
		else if (name == "$ne")
		{
			part = translateEquality(path, &op);
			if (part)
				part = "NOT COALESCE(" + *part + ", FALSE)";
		}
		else if (comparisonOperators_.count(name))
		{
			part = translateComparisonOperator(path, name, &op);
		}
		else if (name == "$in" || name == "$nin")
		{
			part = translateArrayOperator(path, name, &op);
		}
		else if (name == "$exists")
		{
			bool wanted = bson_iter_as_bool(&op);
			part = fieldExpression(path) + (wanted ? " IS NOT NULL" : " IS NULL");
		}
		else
		{
			return std::unexpected(badValue("unknown operator: " + name));
		}

		if (!part)
			return std::unexpected(part.error());
		parts.push_back(*part);
	}

	if (parts.size() == 1)
		return parts.front();
	return "(" + join(parts, " AND ") + ")";
}

CollectionResult<std::string>
CQueryTranslator::translateEquality(const std::string& path,
									const bson_iter_t* operand)
{
	/* Null also matches a missing field */
	if (BSON_ITER_HOLDS_NULL(operand))
	{
		return "(" + fieldExpression(path) + " IS NULL OR " +
			   fieldExpression(path) + " = 'null'::jsonb)";
	}

	auto bound = bindValue(operand);
	if (!bound)
		return std::unexpected(bound.error());
	return fieldExpression(path) + " = " + *bound;
}

CollectionResult<std::string>
CQueryTranslator::translateComparisonOperator(const std::string& path,
											  const std::string& op,
											  const bson_iter_t* operand)
{
	auto bound = bindValue(operand);
	if (!bound)
		return std::unexpected(bound.error());

	/* Ordering only applies within one JSON type */
	std::string field = fieldExpression(path);
	return "(jsonb_typeof(" + field + ") = jsonb_typeof(" + *bound + ") AND " +
		   field + " " + comparisonOperators_.at(op) + " " + *bound + ")";
}

CollectionResult<std::string>
CQueryTranslator::translateArrayOperator(const std::string& path,
										 const std::string& op,
										 const bson_iter_t* operand)
{
	bson_iter_t element;
	std::vector<std::string> alternatives;

	if (!BSON_ITER_HOLDS_ARRAY(operand) || !bson_iter_recurse(operand, &element))
		return std::unexpected(badValue(op + " needs an array"));

	while (bson_iter_next(&element))
	{
		auto part = translateEquality(path, &element);
		if (!part)
			return std::unexpected(part.error());
		alternatives.push_back(*part);
	}

	std::string any = alternatives.empty()
						  ? std::string("FALSE")
						  : "COALESCE(" + join(alternatives, " OR ") + ", FALSE)";
	if (op == "$nin")
		return "NOT " + any;
	return any;
}

CollectionResult<std::string>
CQueryTranslator::translateSort(const CBsonDocument& sort)
{
	bson_iter_t iter;
	std::vector<std::string> sortClauses;

	if (sort.isEmpty())
		return std::string();
	if (!bson_iter_init(&iter, sort.get()))
		return std::unexpected(badValue("sort is not a valid document"));

	while (bson_iter_next(&iter))
	{
		std::string field = bson_iter_key(&iter);
		int64_t direction = bson_iter_as_int64(&iter);

		if (direction != 1 && direction != -1)
			return std::unexpected(
				badValue("sort direction for " + field + " must be 1 or -1"));

		/* Missing fields sort as null, before any value */
		sortClauses.push_back(fieldExpression(field) +
							  (direction == 1 ? " ASC NULLS FIRST"
											  : " DESC NULLS LAST"));
	}

	return join(sortClauses, ", ");
}

CollectionResult<std::string>
CQueryTranslator::translateIndex(const CBsonDocument& keys)
{
	bson_iter_t iter;
	std::vector<std::string> columns;

	if (keys.isEmpty() || !bson_iter_init(&iter, keys.get()))
		return std::unexpected(badValue("index key pattern is empty"));

	while (bson_iter_next(&iter))
	{
		std::string field = bson_iter_key(&iter);
		columns.push_back(fieldExpression(field) +
						  (bson_iter_as_int64(&iter) < 0 ? " DESC" : ""));
	}

	return join(columns, ", ");
}

std::string CQueryTranslator::join(const std::vector<std::string>& elements,
								   const std::string& delimiter)
{
	std::string result;

	for (size_t i = 0; i < elements.size(); ++i)
	{
		if (i > 0)
			result += delimiter;
		result += elements[i];
	}
	return result;
}

} /* namespace DocBucket */
