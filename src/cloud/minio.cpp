#include "cloud/minio.hpp"
#include "utils/utils.hpp"
#include <string>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun {
namespace cloud {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
string MinIO::getAddress() const
// Gets the address of MinIO
{
    return _settings.endpoint;
}
//---------------------------------------------------------------------------
string MinIO::getObjectPath(const string& filePath) const
// MinIO does not support virtual-hosted adresses, thus we use path-style requests
{
    return "/" + _settings.bucket + "/" + utils::encodeUrlPath(filePath);
}
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace memrun
