/* 
 * File:   KeyDistributor.hpp
 * Author: me
 *
 * Created on March 15, 2024, 11:00 AM
 */

#ifndef KEYDISTRIBUTOR_HPP
#define	KEYDISTRIBUTOR_HPP

#include "Crypto.hpp"

#include <stdint.h>
#include <map>
#include <string>
#include <vector>

namespace sdsclient
{
    class SdsContext;
    class TokenManager;
    class Json;
    
    /*
     * Users who may read a file but have no copy of its content key yet, 
     * together with the public keys needed to give them one.
     */
    class MissingKeys {
    public:
        MissingKeys();
        
        static MissingKeys fromJson(const Json& jsonObj);
        
        class Item {
        public:
            uint64_t userId;
            uint64_t fileId;
        };
        
        class PublicKey {
        public:
            std::string version;
            std::string publicKey;
        };
        
        std::vector<Item> items;
        std::map<uint64_t, PublicKey> userPublicKeys;
        // File keys wrapped for the requesting user
        std::map<uint64_t, FileKey> fileKeys;
        // Pairs still missing on the server, this batch included
        uint64_t total;
    };
    
    // A file key wrapped for one user
    class UserFileKey {
    public:
        uint64_t userId;
        uint64_t fileId;
        FileKey fileKey;
    };
    
    /*
     * Hands out content keys to users who lack them. Each call handles one
     * batch of at most BATCH_LIMIT pairs.
     */
    class KeyDistributor {
    public:
        static const std::string URL_MISSING_KEYS;
        static const std::string URL_FILE_KEYS;
        static const int BATCH_LIMIT;
        
        KeyDistributor(SdsContext& ctx, TokenManager& tokens);
        
        virtual ~KeyDistributor();
        
        // 0 for any id leaves that filter out
        MissingKeys getMissingFileKeys(uint64_t fileId, uint64_t roomId=0,
                uint64_t userId=0);
        
        void setFileKeys(const std::vector<UserFileKey>& keys);
        
        /*
         * distributeForFile(): Wraps plainKey, which the caller just 
         *                      created for fileId, for every user missing it.
         *                      Returns the number of keys set.
         */
        size_t distributeForFile(uint64_t fileId, const PlainFileKey& plainKey);
        
        /*
         * distributeMissingKeys(): Unwraps the caller's own copy of each file
         *                          key with keyPair and wraps it again for 
         *                          the users missing it. Returns the number 
         *                          of pairs that were missing before this 
         *                          batch.
         */
        uint64_t distributeMissingKeys(const PlainUserKeyPair& keyPair, 
                uint64_t fileId=0, uint64_t roomId=0, uint64_t userId=0);
        
    private:
        SdsContext& mCtx;
        TokenManager& mTokens;
        
        static void wrapForUser(const MissingKeys& missing, 
                const MissingKeys::Item& item, const PlainFileKey& plainKey, 
                std::vector<UserFileKey>& out);
        
        KeyDistributor(const KeyDistributor& orig);
    };

}

#endif	/* KEYDISTRIBUTOR_HPP */
