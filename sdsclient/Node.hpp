/* 
 * File:   Node.hpp
 * Author: me
 *
 * Created on March 8, 2024, 9:15 AM
 */

#ifndef NODE_HPP
#define	NODE_HPP

#include "SdsEnums.hpp"

#include <stdint.h>
#include <string>

namespace sdsclient
{
    class Json;
    
    // A room, folder or file on the server
    class Node {
    public:
        Node();
        
        static Node fromJson(const Json& jsonObj);
        
        uint64_t getId() const;
        
        const std::string& getName() const;
        
        Node_Type getType() const;
        
        uint64_t getParentId() const;
        
        // False if the server didn't report a size
        bool hasSize() const;
        
        uint64_t getSize() const;
        
        bool isEncrypted() const;
        
        Node& setId(uint64_t id);
        
        Node& setName(const std::string& name);
        
        Node& setType(Node_Type type);
        
        Node& setParentId(uint64_t parentId);
        
        Node& setSize(uint64_t size);
        
        Node& setEncrypted(bool encrypted);
        
    private:
        uint64_t mId;
        std::string mName;
        Node_Type mType;
        uint64_t mParentId;
        bool mHasSize;
        uint64_t mSize;
        bool mIsEncrypted;
        
    };

}

#endif	/* NODE_HPP */
