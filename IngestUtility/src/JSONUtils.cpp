#include "JSONUtils.h"
#include "spdlog/spdlog.h"
#include <fstream>

bool JSONUtils::isMetadataPresent(const json &root, string field)
{
	if (root == nullptr || !root.is_object())
		return false;
	else
		return root.contains(field);
}

bool JSONUtils::isNull(const json &root, string field)
{
	if (root == nullptr)
	{
		string errorMessage = fmt::format(
			"JSONUtils::isNull, root is null"
			", field: {}",
			field
		);
		SPDLOG_ERROR(errorMessage);

		throw runtime_error(errorMessage);
	}

	return !root.contains(field) || root.at(field).is_null();
}

void JSONUtils::fieldNotFound(string field)
{
	string errorMessage = fmt::format(
		"Field is not present or it is null"
		", field: {}",
		field
	);
	SPDLOG_ERROR(errorMessage);

	throw JsonFieldNotFound(errorMessage);
}

string JSONUtils::asString(const json &root, string field, string defaultValue, bool notFoundAsException)
{
	if (root == nullptr)
	{
		if (notFoundAsException)
			fieldNotFound(field);
		return defaultValue;
	}

	try
	{
		if (field == "")
		{
			if (root.type() == json::value_t::number_integer || root.type() == json::value_t::number_unsigned)
				return to_string(root.template get<int64_t>());
			else if (root.type() == json::value_t::number_float)
				return to_string(root.template get<double>());
			else
				return root.template get<string>();
		}
		else
		{
			if (!JSONUtils::isMetadataPresent(root, field) || root.at(field).is_null())
			{
				if (notFoundAsException)
					fieldNotFound(field);
				return defaultValue;
			}
			if (root.at(field).is_number())
				return root.at(field).dump();
			else
				return root.at(field).template get<string>();
		}
	}
	catch (json::type_error &e)
	{
		return defaultValue;
	}
	catch (json::out_of_range &e)
	{
		return defaultValue;
	}
}

int JSONUtils::asInt(const json &root, string field, int defaultValue, bool notFoundAsException)
{
	return static_cast<int>(asInt64(root, field, defaultValue, notFoundAsException));
}

int64_t JSONUtils::asInt64(const json &root, string field, int64_t defaultValue, bool notFoundAsException)
{
	if (root == nullptr)
	{
		if (notFoundAsException)
			fieldNotFound(field);
		return defaultValue;
	}

	try
	{
		if (field == "")
		{
			if (root.type() == json::value_t::string)
				return strtoll(asString(root, "", "0").c_str(), nullptr, 10);
			else
				return root.template get<int64_t>();
		}
		else
		{
			if (!JSONUtils::isMetadataPresent(root, field) || root.at(field).is_null())
			{
				if (notFoundAsException)
					fieldNotFound(field);
				return defaultValue;
			}
			if (root.at(field).type() == json::value_t::string)
				return strtoll(asString(root, field, "0").c_str(), nullptr, 10);
			else
				return root.at(field).template get<int64_t>();
		}
	}
	catch (json::type_error &e)
	{
		return defaultValue;
	}
	catch (json::out_of_range &e)
	{
		return defaultValue;
	}
}

bool JSONUtils::asBool(const json &root, string field, bool defaultValue, bool notFoundAsException)
{
	if (root == nullptr)
	{
		if (notFoundAsException)
			fieldNotFound(field);
		return defaultValue;
	}

	try
	{
		json value;
		if (field == "")
			value = root;
		else
		{
			if (!JSONUtils::isMetadataPresent(root, field) || root.at(field).is_null())
			{
				if (notFoundAsException)
					fieldNotFound(field);
				return defaultValue;
			}
			value = root.at(field);
		}

		if (value.type() == json::value_t::string)
		{
			string sValue = value.template get<string>();
			string sTrue = "true";

			return sValue.length() != sTrue.length()
					   ? false
					   : equal(sValue.begin(), sValue.end(), sTrue.begin(), [](int c1, int c2) { return toupper(c1) == toupper(c2); });
		}
		else
			return value.template get<bool>();
	}
	catch (json::type_error &e)
	{
		return defaultValue;
	}
	catch (json::out_of_range &e)
	{
		return defaultValue;
	}
}

json JSONUtils::asJson(const json &root, string field, json defaultValue, bool notFoundAsException)
{
	if (!JSONUtils::isMetadataPresent(root, field) || root.at(field).is_null())
	{
		if (notFoundAsException)
			fieldNotFound(field);
		return defaultValue;
	}

	return root.at(field);
}

json JSONUtils::toJson(string j, bool warningIfError)
{
	try
	{
		if (j == "")
			return json();
		else
			return json::parse(j);
	}
	catch (json::parse_error &ex)
	{
		string errorMessage = fmt::format(
			"failed to parse the json"
			", json: {}"
			", at byte: {}",
			j, ex.byte
		);
		if (warningIfError)
			SPDLOG_WARN(errorMessage);
		else
			SPDLOG_ERROR(errorMessage);

		throw runtime_error(errorMessage);
	}
}

string JSONUtils::toString(const json &root)
{
	if (root == nullptr)
		return "null";
	else
		return root.dump(-1, ' ', true);
}

json JSONUtils::loadConfigurationFile(string configurationPathName)
{
	try
	{
		ifstream configurationFile(configurationPathName, ifstream::binary);
		return json::parse(
			configurationFile,
			nullptr, // callback
			true,	 // allow exceptions
			true	 // ignore_comments
		);
	}
	catch (json::exception &e)
	{
		string errorMessage = fmt::format(
			"wrong json configuration format"
			", configurationPathName: {}"
			", exception: {}",
			configurationPathName, e.what()
		);

		throw runtime_error(errorMessage);
	}
}
