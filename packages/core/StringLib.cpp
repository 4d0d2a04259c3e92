/*
 * Copyright (c) 2021, University of Washington
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * 3. Neither the name of the University of Washington nor the names of its
 *    contributors may be used to endorse or promote products derived from this
 *    software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE UNIVERSITY OF WASHINGTON AND CONTRIBUTORS
 * “AS IS” AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE UNIVERSITY OF WASHINGTON OR
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;
 * OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR
 * OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "StringLib.h"
#include "OsApi.h"

#include <stdarg.h>
#include <stdlib.h>
#include <string.h>

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * duplicate
 *
 *  caller is responsible for freeing memory
 *----------------------------------------------------------------------------*/
char* StringLib::duplicate(const char* str1, int size)
{
    int len;
    if(str1 == NULL) return NULL;
    if(size > 0) len = (int)strnlen(str1, size - 1) + 1;
    else len = (int)strlen(str1) + 1;
    if(len < 1) return NULL;
    char* dup = new char[len];
    StringLib::copy(dup, str1, len);
    return dup;
}

/*----------------------------------------------------------------------------
 * format
 *
 *  no memory allocated
 *----------------------------------------------------------------------------*/
char* StringLib::format(char* dststr, int size, const char* _format, ...)
{
    if (dststr == NULL) return NULL;
    va_list args;
    va_start(args, _format);
    const int vlen = vsnprintf(dststr, size, _format, args);
    const int slen = MIN(vlen, size - 1);
    va_end(args);
    if (slen < 1) return NULL;
    dststr[slen] = '\0';
    return dststr;
}

/*----------------------------------------------------------------------------
 * strfmt
 *----------------------------------------------------------------------------*/
std::string StringLib::strfmt(const char* _format, ...)
{
    char buffer[MAX_STR_SIZE];
    va_list args;
    va_start(args, _format);
    const int vlen = vsnprintf(buffer, MAX_STR_SIZE, _format, args);
    va_end(args);
    if(vlen < 0) return std::string();
    buffer[MIN(vlen, MAX_STR_SIZE - 1)] = '\0';
    return std::string(buffer);
}

/*----------------------------------------------------------------------------
 * copy
 *----------------------------------------------------------------------------*/
char* StringLib::copy(char* str1, const char* str2, int _size)
{
    if(str1 && str2 && (_size > 0))
    {
        char* nptr = (char*)memccpy(str1, str2, 0, _size);
        if(!nptr) str1[_size - 1] = '\0';
    }
    else if(str1 && (_size > 0))
    {
        str1[0] = '\0';
    }

    return str1;
}

/*----------------------------------------------------------------------------
 * find
 *
 *  assumes that str is null terminated
 *----------------------------------------------------------------------------*/
char* StringLib::find(const char* str, const char c, bool first)
{
    if(first)   return (char*)strchr(str, c);
    else        return (char*)strrchr(str, c);
}

/*----------------------------------------------------------------------------
 * match
 *
 *  exact match only
 *----------------------------------------------------------------------------*/
bool StringLib::match(const char* str1, const char* str2, int len)
{
    return strncmp(str1, str2, len) == 0;
}

/*----------------------------------------------------------------------------
 * csvField
 *
 *  quotes the field when it holds the delimiter or any quote/newline character
 *----------------------------------------------------------------------------*/
std::string StringLib::csvField(const std::string& field, char delimiter)
{
    if(field.find(delimiter) == std::string::npos &&
       field.find('"') == std::string::npos &&
       field.find('\n') == std::string::npos)
    {
        return field;
    }

    std::string quoted = "\"";
    for(const char c : field)
    {
        if(c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}
