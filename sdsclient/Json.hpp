/* 
 * File:   Json.hpp
 * Author: me
 *
 * Created on March 3, 2024, 1:12 PM
 */

#ifndef JSON_HPP
#define	JSON_HPP

#include <json-c/json.h>
#include <stdint.h>
#include <string>


namespace sdsclient
{

    /*
     * Reference-counted handle on a json-c object. Keys may name nested 
     * members by separating the levels with '/', e.g. "node/id". An empty key
     * refers to the object itself.
     */
    class Json {
    public:
        explicit Json(const std::string& inStr);
        
        // Creates an empty JSON object
        Json();
        
        Json(const Json& orig);
        
        Json& operator=(const Json& orig);
        
        virtual ~Json();
        
        static Json newArray();
        
        bool isValid() const;
        
        bool has(const std::string& key) const;
        
        bool isNull(const std::string& key) const;
        
        Json getNestedObject(const std::string& key="") const;

        std::string getString(const std::string& key="") const;

        int64_t getInt64(const std::string& key, bool& success) const;
        
        // Returns defaultValue when the key is missing or not numeric
        int64_t getInt64(const std::string& key, int64_t defaultValue) const;

        bool getBoolean(const std::string& key, bool defaultValue) const;

        Json& addString(const std::string& key, const std::string& str);

        Json& addInt64(const std::string& key, int64_t value);

        Json& addBoolean(const std::string& key, bool value);
        
        Json& addObject(const std::string& key, const Json& obj);

        Json addNewArray(const std::string& key);

        std::string toString(bool pretty=false) const;

        int getArrayLength(const std::string& key="") const;
        
        Json arrayGet(const std::string& key, int index) const;
        
        Json arrayGet(int index) const;

        int arrayAppend(const Json& newObj);

        int arrayAppendString(const std::string& val);

        
    private:
        json_object* mpJsonObj;
        
        explicit Json(json_object* pObj);
        
        json_object* getNestedInternal(const std::string& key) const;
        
    };

}

#endif	/* JSON_HPP */
