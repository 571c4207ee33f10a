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


namespace xoauthxx
{


/**
Base64 encoder (RFC 4648) producing a single unwrapped line.

SASL initial responses are sent on one command line, so unlike MIME bodies there is no line policy: the encoder
never inserts line breaks.
**/
class base64
{
public:

    /**
    Base64 character set.
    **/
    static constexpr std::string_view CHARSET{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    static constexpr char EQUAL_CHAR = '=';

    /**
    Encoding a string into one Base64 line, padded with `=`.

    @param text String to encode.
    @return     Base64 encoded string.
    **/
    [[nodiscard]] static std::string encode(std::string_view text)
    {
        std::string enc_text;
        enc_text.reserve((text.size() + OCTETS_NO - 1) / OCTETS_NO * SEXTETS_NO);
        unsigned char octets[OCTETS_NO];
        unsigned char sextets[SEXTETS_NO];
        int octets_counter = 0;

        for (char ch : text)
        {
            octets[octets_counter++] = static_cast<unsigned char>(ch);
            if (octets_counter == OCTETS_NO)
            {
                to_sextets(octets, sextets);
                for (int i = 0; i < SEXTETS_NO; i++)
                    enc_text += CHARSET[sextets[i]];
                octets_counter = 0;
            }
        }

        // encode remaining characters if any

        if (octets_counter > 0)
        {
            for (int i = octets_counter; i < OCTETS_NO; i++)
                octets[i] = '\0';
            to_sextets(octets, sextets);

            for (int i = 0; i < octets_counter + 1; i++)
                enc_text += CHARSET[sextets[i]];
            for (int i = octets_counter; i < OCTETS_NO; i++)
                enc_text += EQUAL_CHAR;
        }

        return enc_text;
    }

private:

    static void to_sextets(const unsigned char (&octets)[3], unsigned char (&sextets)[4]) noexcept
    {
        sextets[0] = (octets[0] & 0xfc) >> 2;
        sextets[1] = ((octets[0] & 0x03) << 4) + ((octets[1] & 0xf0) >> 4);
        sextets[2] = ((octets[1] & 0x0f) << 2) + ((octets[2] & 0xc0) >> 6);
        sextets[3] = octets[2] & 0x3f;
    }

    /**
    Number of six bit chunks.
    **/
    static constexpr int SEXTETS_NO = 4;

    /**
    Number of eight bit characters.
    **/
    static constexpr int OCTETS_NO = SEXTETS_NO - 1;
};


} // namespace xoauthxx
