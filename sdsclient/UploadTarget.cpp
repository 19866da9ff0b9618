/* 
 * File:   UploadTarget.cpp
 * Author: me
 * 
 * Created on March 13, 2024, 10:30 AM
 */

#include "UploadTarget.hpp"

namespace sdsclient
{
    UploadTarget::~UploadTarget()
    {
        // Empty
    }

}
