#pragma once

// 틱마다의 결정변수 인덱스 배치
//
//   x = [ vd (nv) | tau (na) | f_0 (3) ... f_{nc-1} (3) | delta (1) ]
//
// nc (접촉발 수) 가 틱마다 바뀌므로 매 틱 새로 생성
struct QpLayout {
    QpLayout(int nv, int na, int nc) : nv(nv), na(na), nc(nc) {}

    int nv;
    int na;
    int nc;

    int vd()           const { return 0; }
    int tau()          const { return nv; }
    int force(int k)   const { return nv + na + 3 * k; }
    int forces()       const { return nv + na; }
    int delta()        const { return nv + na + 3 * nc; }
    int numVars()      const { return delta() + 1; }
};
