/* 
 * File:   Node.cpp
 * Author: me
 * 
 * Created on March 8, 2024, 9:15 AM
 */

#include "Node.hpp"
#include "Json.hpp"

using namespace std;

namespace sdsclient
{
    Node::Node()
    : mId(0), mType(NODE_FILE), mParentId(0), mHasSize(false), mSize(0), 
            mIsEncrypted(false)
    {
        // No body
    }
    
    Node Node::fromJson(const Json& jsonObj)
    {
        Node node;
        node.mId = (uint64_t) jsonObj.getInt64("id", (int64_t) 0);
        node.mName = jsonObj.getString("name");
        node.mParentId = (uint64_t) jsonObj.getInt64("parentId", (int64_t) 0);
        
        string type = jsonObj.getString("type");
        if (type == "room")
        {
            node.mType = NODE_ROOM;
        }
        else if (type == "folder")
        {
            node.mType = NODE_FOLDER;
        }
        else
        {
            node.mType = NODE_FILE;
        }
        
        bool success = false;
        int64_t size = jsonObj.getInt64("size", success);
        if (success && size >= 0)
        {
            node.mHasSize = true;
            node.mSize = (uint64_t) size;
        }
        node.mIsEncrypted = jsonObj.getBoolean("isEncrypted", false);
        
        return node;
    }
    
    uint64_t Node::getId() const
    {
        return mId;
    }
    
    const string& Node::getName() const
    {
        return mName;
    }
    
    Node_Type Node::getType() const
    {
        return mType;
    }
    
    uint64_t Node::getParentId() const
    {
        return mParentId;
    }
    
    bool Node::hasSize() const
    {
        return mHasSize;
    }
    
    uint64_t Node::getSize() const
    {
        return mSize;
    }
    
    bool Node::isEncrypted() const
    {
        return mIsEncrypted;
    }
    
    Node& Node::setId(uint64_t id)
    {
        mId = id;
        return *this;
    }
    
    Node& Node::setName(const string& name)
    {
        mName = name;
        return *this;
    }
    
    Node& Node::setType(Node_Type type)
    {
        mType = type;
        return *this;
    }
    
    Node& Node::setParentId(uint64_t parentId)
    {
        mParentId = parentId;
        return *this;
    }
    
    Node& Node::setSize(uint64_t size)
    {
        mHasSize = true;
        mSize = size;
        return *this;
    }
    
    Node& Node::setEncrypted(bool encrypted)
    {
        mIsEncrypted = encrypted;
        return *this;
    }

}
