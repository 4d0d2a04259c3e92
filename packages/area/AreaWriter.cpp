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

#include "AreaWriter.h"
#include "EventLib.h"
#include "StringLib.h"

#include <errno.h>
#include <string.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

const char* AreaWriter::DEFAULT_INDEX_NAME = "Country";

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * toCsv
 *----------------------------------------------------------------------------*/
std::string AreaWriter::toCsv(const AreaMatrix& matrix, const OutputFormat& format)
{
    if(format.precision < 0 || format.precision > MAX_PRECISION)
        throw RunTimeException(CRITICAL, RTE_INVALID_CONFIG, "invalid output precision: %d", format.precision);

    std::string csv;

    /* Header Row */
    csv += StringLib::csvField(format.indexName, format.delimiter);
    for(const class_key_t& column: matrix.getColumns())
    {
        csv += format.delimiter;
        csv += StringLib::csvField(column, format.delimiter);
    }
    csv += '\n';

    /* Region Rows */
    const std::vector<AreaMatrix::row_t> rows = matrix.serialize();
    for(const AreaMatrix::row_t& row: rows)
    {
        csv += StringLib::csvField(row.region, format.delimiter);
        for(const double value: row.values)
        {
            csv += format.delimiter;
            csv += StringLib::strfmt("%.*f", format.precision, value);
        }
        csv += '\n';
    }

    return csv;
}

/*----------------------------------------------------------------------------
 * write
 *----------------------------------------------------------------------------*/
void AreaWriter::write(const std::string& fileName, const AreaMatrix& matrix, const OutputFormat& format)
{
    const std::string csv = toCsv(matrix, format);

    FILE* fp = fopen(fileName.c_str(), "w");
    if(fp == NULL)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "Failed to open %s for writing: %s", fileName.c_str(), strerror(errno));
    }

    const size_t written = fwrite(csv.c_str(), 1, csv.size(), fp);
    const int status = fclose(fp);
    if(written != csv.size() || status != 0)
    {
        throw RunTimeException(CRITICAL, RTE_ERROR, "Failed to write %s", fileName.c_str());
    }

    mlog(INFO, "Wrote %d regions by %ld classes to %s", matrix.numRegions(), (long)matrix.getColumns().size(), fileName.c_str());
}
