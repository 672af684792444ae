/*

base64.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>

#include <imapxx/detail/result.hpp>


namespace imapxx
{


/**
Single-line Base64 codec, as used by SASL exchanges.

IMAP continuation payloads must fit on one line, so the encoder never wraps.
**/
class base64
{
public:

    /**
    Base64 character set.
    **/
    static constexpr std::string_view CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    /**
    Encoding a string into one Base64 line, padded with `=`.

    @param text String to encode.
    @return     Encoded text.
    **/
    [[nodiscard]] static std::string encode(std::string_view text)
    {
        std::string enc_text;
        enc_text.reserve((text.size() + 2) / OCTETS_NO * SEXTETS_NO);
        unsigned char octets[OCTETS_NO];
        int octets_counter = 0;

        for (char ch : text)
        {
            octets[octets_counter++] = static_cast<unsigned char>(ch);
            if (octets_counter == OCTETS_NO)
            {
                append_sextets(enc_text, octets, SEXTETS_NO);
                octets_counter = 0;
            }
        }

        // encode remaining characters if any
        if (octets_counter > 0)
        {
            for (int i = octets_counter; i < OCTETS_NO; i++)
                octets[i] = '\0';
            append_sextets(enc_text, octets, octets_counter + 1);
            while (octets_counter++ < OCTETS_NO)
                enc_text += EQUAL_CHAR;
        }

        return enc_text;
    }

    /**
    Decoding a Base64 line.

    @param text Base64 text, padding optional.
    @return     Decoded string or `invalid_argument` on a bad character.
    **/
    [[nodiscard]] static result<std::string> decode(std::string_view text)
    {
        std::string dec_text;
        dec_text.reserve(text.size() / SEXTETS_NO * OCTETS_NO);
        unsigned char sextets[SEXTETS_NO];
        int count_4_chars = 0;

        for (char ch : text)
        {
            if (ch == EQUAL_CHAR)
                break;
            const auto pos = CHARSET.find(ch);
            if (pos == std::string_view::npos)
            {
                std::string message = "Bad base64 character `";
                message += ch;
                message += "`.";
                return fail<std::string>(error_code::invalid_argument, std::move(message));
            }

            sextets[count_4_chars++] = static_cast<unsigned char>(pos);
            if (count_4_chars == SEXTETS_NO)
            {
                append_octets(dec_text, sextets, OCTETS_NO);
                count_4_chars = 0;
            }
        }

        // decode remaining characters if any
        if (count_4_chars == 1)
            return fail<std::string>(error_code::invalid_argument, "Truncated base64 input.");
        if (count_4_chars > 0)
        {
            for (int i = count_4_chars; i < SEXTETS_NO; i++)
                sextets[i] = 0;
            append_octets(dec_text, sextets, count_4_chars - 1);
        }

        return dec_text;
    }

private:

    static void append_sextets(std::string& out, const unsigned char* octets, int count)
    {
        unsigned char sextets[SEXTETS_NO];
        sextets[0] = (octets[0] & 0xfc) >> 2;
        sextets[1] = ((octets[0] & 0x03) << 4) + ((octets[1] & 0xf0) >> 4);
        sextets[2] = ((octets[1] & 0x0f) << 2) + ((octets[2] & 0xc0) >> 6);
        sextets[3] = octets[2] & 0x3f;
        for (int i = 0; i < count; i++)
            out += CHARSET[sextets[i]];
    }

    static void append_octets(std::string& out, const unsigned char* sextets, int count)
    {
        unsigned char octets[OCTETS_NO];
        octets[0] = (sextets[0] << 2) + ((sextets[1] & 0x30) >> 4);
        octets[1] = ((sextets[1] & 0xf) << 4) + ((sextets[2] & 0x3c) >> 2);
        octets[2] = ((sextets[2] & 0x3) << 6) + sextets[3];
        for (int i = 0; i < count; i++)
            out += static_cast<char>(octets[i]);
    }

    static constexpr char EQUAL_CHAR = '=';

	/**
	Number of six bit chunks.
	**/
	static constexpr int SEXTETS_NO = 4;

	/**
	Number of eight bit characters.
	**/
	static constexpr int OCTETS_NO = SEXTETS_NO - 1;
};


} // namespace imapxx
