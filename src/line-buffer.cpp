/**
 * @license
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.

 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.

 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 * @author Volker Böhm
 * @copyright Copyright (c) 2025 Volker Böhm
 */

#include "line-buffer.h"
#include "string-helper.h"

std::vector<std::string> LineBuffer::append(std::string_view chunk)
{
    std::vector<std::string> lines;
    size_t start = 0;
    for (size_t i = 0; i < chunk.size(); ++i)
    {
        if (chunk[i] != '\n')
        {
            continue;
        }
        pending_.append(chunk.data() + start, i - start);
        start = i + 1;
        if (!pending_.empty() && pending_.back() == '\r')
        {
            pending_.pop_back();
        }
        if (!isBlank(pending_))
        {
            lines.push_back(std::move(pending_));
        }
        pending_.clear();
    }
    if (start < chunk.size())
    {
        pending_.append(chunk.data() + start, chunk.size() - start);
    }
    return lines;
}
