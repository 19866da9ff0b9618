/* 
 * File:   Json.cpp
 * Author: me
 * 
 * Created on March 3, 2024, 1:12 PM
 */

#include "Json.hpp"


using namespace std;

namespace sdsclient
{

    Json::Json(const string& inStr)
    : mpJsonObj(json_tokener_parse(inStr.c_str()))
    {
        // No body
    }

    Json::Json()
    : mpJsonObj(json_object_new_object())
    {
        // No body
    }
    
    Json::Json(const Json& orig)
    : mpJsonObj(json_object_get(orig.mpJsonObj))
    {
        // No body
    }
    
    Json& Json::operator=(const Json& orig)
    {
        // Take the new reference before dropping the old one, in case both
        // are the same object.
        json_object* pOld = mpJsonObj;
        mpJsonObj = json_object_get(orig.mpJsonObj);
        json_object_put(pOld);
        return *this;
    }

    Json::~Json()
    {
        json_object_put(mpJsonObj);
    }
    
    Json Json::newArray()
    {
        json_object* pArray = json_object_new_array();
        Json result(pArray);
        // Json(json_object*) took its own reference
        json_object_put(pArray);
        return result;
    }
    
    bool Json::isValid() const
    {
        return (mpJsonObj != NULL);
    }
    
    bool Json::has(const string& key) const
    {
        return getNestedInternal(key) != NULL;
    }
    
    bool Json::isNull(const string& key) const
    {
        json_object* pInnerObj = getNestedInternal(key);
        return pInnerObj == NULL || json_object_is_type(pInnerObj, json_type_null);
    }

    Json Json::getNestedObject(const string& key) const
    {
        return Json(getNestedInternal(key));
    }

    string Json::getString(const string& key) const
    {
        json_object* pInnerObj = getNestedInternal(key);
        if (pInnerObj == NULL || 
                !json_object_is_type(pInnerObj, json_type_string))
        {
            return "";
        }

        const char* jsonStr = json_object_get_string(pInnerObj);
        int length = json_object_get_string_len(pInnerObj);
        return jsonStr ? string(jsonStr, length) : string();
    }

    int64_t Json::getInt64(const string& key, bool& success) const
    {
        json_object* pInnerObj = getNestedInternal(key);
        if (pInnerObj == NULL || 
                !(json_object_is_type(pInnerObj, json_type_int) || 
                json_object_is_type(pInnerObj, json_type_double)))
        {
            success = false;
            return 0;
        }
        
        success = true;
        return json_object_get_int64(pInnerObj);
    }
    
    int64_t Json::getInt64(const string& key, int64_t defaultValue) const
    {
        bool success = false;
        int64_t value = getInt64(key, success);
        return success ? value : defaultValue;
    }

    bool Json::getBoolean(const string& key, bool defaultValue) const
    {
        json_object* pInnerObj = getNestedInternal(key);
        if (pInnerObj == NULL || 
                !json_object_is_type(pInnerObj, json_type_boolean))
        {
            return defaultValue;
        }
        return json_object_get_boolean(pInnerObj) ? true : false;
    }

    Json& Json::addString(const string& key, const string& str)
    {
        // json_object_object_add() takes over the reference returned by
        // json_object_new_*(), so nothing needs to be released here or in the
        // other add*() methods.
        json_object_object_add(mpJsonObj, key.c_str(), 
                json_object_new_string_len(str.data(), (int) str.length()));
        return *this;
    }

    Json& Json::addInt64(const string& key, int64_t value)
    {
        json_object_object_add(mpJsonObj, key.c_str(), 
                json_object_new_int64(value));
        return *this;
    }

    Json& Json::addBoolean(const string& key, bool value)
    {
        json_object_object_add(mpJsonObj, key.c_str(), 
                json_object_new_boolean(value));
        return *this;
    }
    
    Json& Json::addObject(const string& key, const Json& obj)
    {
        // The parent keeps its own reference, obj stays usable.
        json_object_object_add(mpJsonObj, key.c_str(), 
                json_object_get(obj.mpJsonObj));
        return *this;
    }

    Json Json::addNewArray(const string& key)
    {
        json_object* pArray = json_object_new_array();
        json_object_object_add(mpJsonObj, key.c_str(), pArray);

        // Returned so the caller can fill it in place.
        return Json(pArray);
    }

    string Json::toString(bool pretty) const
    {
        int flags = pretty ? 
            JSON_C_TO_STRING_PRETTY : 
            JSON_C_TO_STRING_PLAIN;
        // Forward slashes in URLs shouldn't come out as "\/"
        flags |= JSON_C_TO_STRING_NOSLASHESCAPE;
        const char* result = json_object_to_json_string_ext(mpJsonObj, flags);
        return result ? string(result) : string();
    }

    int Json::getArrayLength(const string& key) const
    {
        json_object* pInnerObj = getNestedInternal(key);
        if (pInnerObj == NULL || !json_object_is_type(pInnerObj, json_type_array))
        {
            // Missing or not an array
            return -1;
        }
        return json_object_array_length(pInnerObj);
    }
    
    Json Json::arrayGet(const string& key, int index) const
    {
        json_object* pInnerObj = getNestedInternal(key);
        if (pInnerObj == NULL || !json_object_is_type(pInnerObj, json_type_array))
        {
            return Json((json_object*) NULL);
        }
        return Json(json_object_array_get_idx(pInnerObj, index));
    }

    Json Json::arrayGet(int index) const
    {
        return arrayGet("", index);
    }
    
    int Json::arrayAppend(const Json& newObj)
    {
        return json_object_array_add(mpJsonObj, 
                json_object_get(newObj.mpJsonObj));
    }

    int Json::arrayAppendString(const string& val)
    {
        return json_object_array_add(mpJsonObj, 
                json_object_new_string_len(val.data(), (int) val.length()));
    }

    Json::Json(json_object* pObj)
    : mpJsonObj(json_object_get(pObj))
    {
        // No body
    }
    
    json_object* Json::getNestedInternal(const string& key) const
    {
        if (key.empty() || mpJsonObj == NULL)
        {
            return mpJsonObj;
        }

        // Walk one '/'-separated level at a time.
        size_t startIndex = 0;
        size_t endIndex = 0;
        json_object* pCurrent = mpJsonObj;

        do
        {
            endIndex = key.find('/', startIndex);
            string currentKey = (endIndex == string::npos) ? 
                key.substr(startIndex) : 
                key.substr(startIndex, endIndex - startIndex);
            
            json_object* pNext = NULL;
            if (!json_object_is_type(pCurrent, json_type_object) || 
                    !json_object_object_get_ex(pCurrent, currentKey.c_str(), 
                    &pNext))
            {
                return NULL;
            }

            pCurrent = pNext;
            startIndex = endIndex + 1;
        } while (endIndex != string::npos && pCurrent != NULL);

        return pCurrent;
    }


}
