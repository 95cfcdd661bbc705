#ifndef FIBERFUSE_BVH_H
#define FIBERFUSE_BVH_H
#include <clipper2/clipper.h>
#include <algorithm>
#include <functional>
#include <numeric>
#include <utility>
#include <vector>

struct BVHNode {
    Clipper2Lib::Rect64 box;
    int left{-1};
    int right{-1};
    int index{-1};
};

struct BVH {
    std::vector<BVHNode> nodes;
};

inline Clipper2Lib::Rect64 combine(const Clipper2Lib::Rect64& a,const Clipper2Lib::Rect64& b){
    Clipper2Lib::Rect64 r;
    r.left = std::min(a.left,b.left);
    r.right = std::max(a.right,b.right);
    r.top = std::min(a.top,b.top);
    r.bottom = std::max(a.bottom,b.bottom);
    return r;
}

inline bool boxesIntersect(const Clipper2Lib::Rect64& a,const Clipper2Lib::Rect64& b){
    return !(a.right < b.left || a.left > b.right || a.bottom < b.top || a.top > b.bottom);
}

// Median split along the longer axis of the node box.
inline BVH buildBVH(const std::vector<Clipper2Lib::Rect64>& boxes){
    BVH bvh;
    size_t n=boxes.size();
    if(n==0) return bvh;
    bvh.nodes.reserve(2*n);
    std::vector<int> indices(n);
    std::iota(indices.begin(),indices.end(),0);
    std::function<int(int,int)> build=[&](int l,int r){
        int nodeIdx=bvh.nodes.size();
        bvh.nodes.push_back({});
        if(l==r){
            bvh.nodes[nodeIdx].index=indices[l];
            bvh.nodes[nodeIdx].box=boxes[indices[l]];
            return nodeIdx;
        }
        Clipper2Lib::Rect64 box=boxes[indices[l]];
        for(int i=l+1;i<=r;++i) box=combine(box,boxes[indices[i]]);
        bool alongX = (box.right-box.left) > (box.bottom-box.top);
        std::sort(indices.begin()+l, indices.begin()+r+1, [&](int a,int b){
            const auto& ba=boxes[a];
            const auto& bb=boxes[b];
            int64_t ca = alongX ? (ba.left+ba.right) : (ba.top+ba.bottom);
            int64_t cb = alongX ? (bb.left+bb.right) : (bb.top+bb.bottom);
            return ca < cb;
        });
        int mid=(l+r)/2;
        int left=build(l,mid);
        int right=build(mid+1,r);
        bvh.nodes[nodeIdx].left=left;
        bvh.nodes[nodeIdx].right=right;
        bvh.nodes[nodeIdx].box=combine(bvh.nodes[left].box,bvh.nodes[right].box);
        return nodeIdx;
    };
    build(0,(int)n-1);
    return bvh;
}

inline void candidatePairs(const BVH& t,int aIdx,int bIdx,
                           std::vector<std::pair<int,int>>& out){
    const BVHNode& na=t.nodes[aIdx];
    const BVHNode& nb=t.nodes[bIdx];
    if(!boxesIntersect(na.box,nb.box)) return;
    if(aIdx==bIdx){
        if(na.index!=-1) return;
        candidatePairs(t,na.left,na.left,out);
        candidatePairs(t,na.right,na.right,out);
        candidatePairs(t,na.left,na.right,out);
        return;
    }
    if(na.index!=-1 && nb.index!=-1){
        out.emplace_back(std::min(na.index,nb.index), std::max(na.index,nb.index));
        return;
    }
    if(na.index==-1){
        candidatePairs(t,na.left,bIdx,out);
        candidatePairs(t,na.right,bIdx,out);
    } else {
        candidatePairs(t,aIdx,nb.left,out);
        candidatePairs(t,aIdx,nb.right,out);
    }
}

// Unordered index pairs (i < j) whose boxes intersect, sorted.
inline std::vector<std::pair<int,int>> candidatePairs(const BVH& t){
    std::vector<std::pair<int,int>> out;
    if(t.nodes.empty()) return out;
    candidatePairs(t,0,0,out);
    std::sort(out.begin(),out.end());
    return out;
}

#endif
