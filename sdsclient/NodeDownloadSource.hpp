/* 
 * File:   NodeDownloadSource.hpp
 * Author: me
 *
 * Created on March 18, 2024, 2:10 PM
 */

#ifndef NODEDOWNLOADSOURCE_HPP
#define	NODEDOWNLOADSOURCE_HPP

#include "Downloader.hpp"
#include "Node.hpp"

#include <string>

namespace sdsclient
{
    class TokenManager;
    class KeyPairService;
    
    // A file node of the signed-in user
    class NodeDownloadSource : public DownloadSource {
    public:
        NodeDownloadSource(SdsContext& ctx, TokenManager& tokens, 
                KeyPairService& keyPairs, const Node& node);
        
        virtual ~NodeDownloadSource();
        
        virtual std::string requestDownloadUrl();
        
        virtual bool knownSize(uint64_t& size);
        
        virtual bool isEncrypted();
        
        // Needs the key pair to be unlocked already
        virtual PlainFileKey fileKey();
        
        // The file key wrapped for the signed-in user
        FileKey getUserFileKey();
        
    private:
        SdsContext& mCtx;
        TokenManager& mTokens;
        KeyPairService& mKeyPairs;
        Node mNode;
        
        NodeDownloadSource(const NodeDownloadSource& orig);
    };

}

#endif	/* NODEDOWNLOADSOURCE_HPP */
