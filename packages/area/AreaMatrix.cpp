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

#include "AreaMatrix.h"
#include "EventLib.h"

#include <cmath>

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * Constructor
 *----------------------------------------------------------------------------*/
AreaMatrix::AreaMatrix(const std::vector<class_key_t>& _columns):
    columns(_columns)
{
    for(size_t i = 0; i < columns.size(); i++)
    {
        if(columnIndex.find(columns[i]) != columnIndex.end())
            throw RunTimeException(CRITICAL, RTE_ERROR, "duplicate column: %s", columns[i].c_str());

        columnIndex[columns[i]] = static_cast<int>(i);
    }
}

/*----------------------------------------------------------------------------
 * ensureRegion
 *----------------------------------------------------------------------------*/
void AreaMatrix::ensureRegion(const std::string& region)
{
    if(rows.find(region) == rows.end())
    {
        rows[region] = std::vector<double>(columns.size(), 0.0);
    }
}

/*----------------------------------------------------------------------------
 * add
 *----------------------------------------------------------------------------*/
void AreaMatrix::add(const std::string& region, const class_key_t& key, double km2)
{
    const auto col = columnIndex.find(key);
    if(col == columnIndex.end())
    {
        mlog(DEBUG, "Ignoring area for unknown class %s in %s", key.c_str(), region.c_str());
        return;
    }

    if(!std::isfinite(km2) || km2 < 0.0)
    {
        mlog(DEBUG, "Ignoring invalid area %lf for %s in %s", km2, key.c_str(), region.c_str());
        return;
    }

    ensureRegion(region);
    rows[region][col->second] += km2;
}

/*----------------------------------------------------------------------------
 * merge
 *----------------------------------------------------------------------------*/
void AreaMatrix::merge(const AreaMatrix& other)
{
    if(other.columns != columns)
        throw RunTimeException(CRITICAL, RTE_ERROR, "cannot merge matrices with different columns");

    for(const auto& entry: other.rows)
    {
        ensureRegion(entry.first);
        std::vector<double>& values = rows[entry.first];
        for(size_t i = 0; i < values.size(); i++)
        {
            values[i] += entry.second[i];
        }
    }
}

/*----------------------------------------------------------------------------
 * get
 *----------------------------------------------------------------------------*/
double AreaMatrix::get(const std::string& region, const class_key_t& key) const
{
    const auto row = rows.find(region);
    const auto col = columnIndex.find(key);
    if(row == rows.end() || col == columnIndex.end()) return 0.0;
    return row->second[col->second];
}

/*----------------------------------------------------------------------------
 * total
 *----------------------------------------------------------------------------*/
double AreaMatrix::total(const std::string& region) const
{
    double sum = 0.0;
    const auto row = rows.find(region);
    if(row != rows.end())
    {
        for(const double value: row->second) sum += value;
    }
    return sum;
}

/*----------------------------------------------------------------------------
 * hasRegion
 *----------------------------------------------------------------------------*/
bool AreaMatrix::hasRegion(const std::string& region) const
{
    return rows.find(region) != rows.end();
}

/*----------------------------------------------------------------------------
 * serialize
 *
 *  Rows in ascending region order
 *----------------------------------------------------------------------------*/
std::vector<AreaMatrix::row_t> AreaMatrix::serialize(void) const
{
    std::vector<row_t> table;
    table.reserve(rows.size());
    for(const auto& entry: rows)
    {
        row_t row;
        row.region = entry.first;
        row.values = entry.second;
        table.push_back(row);
    }
    return table;
}
