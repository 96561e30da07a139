// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The upnpcast Project

#pragma once

#include <expat.h>

#include <new>
#include <stdexcept>
#include <string_view>

class ExpatError final : public std::runtime_error {
public:
	explicit ExpatError(XML_Error code)
		:std::runtime_error(XML_ErrorString(code)) {}

	explicit ExpatError(XML_Parser parser)
		:ExpatError(XML_GetErrorCode(parser)) {}
};

/**
 * RAII wrapper for an expat #XML_Parser.
 */
class ExpatParser final {
	const XML_Parser parser;

public:
	explicit ExpatParser(void *user_data)
		:parser(XML_ParserCreate(nullptr)) {
		if (parser == nullptr)
			throw std::bad_alloc{};

		XML_SetUserData(parser, user_data);
	}

	~ExpatParser() noexcept {
		XML_ParserFree(parser);
	}

	ExpatParser(const ExpatParser &) = delete;
	ExpatParser &operator=(const ExpatParser &) = delete;

	void SetElementHandler(XML_StartElementHandler start,
			       XML_EndElementHandler end) noexcept {
		XML_SetElementHandler(parser, start, end);
	}

	void SetCharacterDataHandler(XML_CharacterDataHandler charhndl) noexcept {
		XML_SetCharacterDataHandler(parser, charhndl);
	}

	/**
	 * Throws #ExpatError on error.
	 */
	void Parse(std::string_view src, bool is_final=true);

	/**
	 * Look up an attribute in the list passed to the
	 * #XML_StartElementHandler.
	 */
	[[gnu::pure]]
	static const char *GetAttribute(const XML_Char **atts,
					const char *name) noexcept;
};

/**
 * A specialization of #ExpatParser which dispatches to virtual
 * methods.
 */
class CommonExpatParser {
	ExpatParser parser;

public:
	CommonExpatParser()
		:parser(this) {
		parser.SetElementHandler(StartElement, EndElement);
		parser.SetCharacterDataHandler(CharacterData);
	}

	virtual ~CommonExpatParser() noexcept = default;

	void Parse(std::string_view src, bool is_final=true) {
		parser.Parse(src, is_final);
	}

protected:
	virtual void StartElement(const XML_Char *name,
				  const XML_Char **attrs) = 0;
	virtual void EndElement(const XML_Char *name) = 0;
	virtual void CharacterData(const XML_Char *s, int len) = 0;

private:
	static void XMLCALL StartElement(void *user_data, const XML_Char *name,
					 const XML_Char **attrs) {
		auto &p = *(CommonExpatParser *)user_data;
		p.StartElement(name, attrs);
	}

	static void XMLCALL EndElement(void *user_data, const XML_Char *name) {
		auto &p = *(CommonExpatParser *)user_data;
		p.EndElement(name);
	}

	static void XMLCALL CharacterData(void *user_data,
					  const XML_Char *s, int len) {
		auto &p = *(CommonExpatParser *)user_data;
		p.CharacterData(s, len);
	}
};
